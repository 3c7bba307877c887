// status.hpp — Typed failure reporting for the collision core.
//
// The core never throws: fallible calls return bool and fill a CollisionStatus,
// the same "bool + error out-parameter" shape the OBJ layer uses with a plain
// string. Outer layers (CLI exit codes, Python exceptions) map the code.
//
#pragma once
#include <atomic>
#include <string>

enum class CollisionErrc {
    Ok = 0,
    EmptyInput,       // no source vertices at all
    DegenerateInput,  // hull impossible (coplanar / too few unique points), unusable geometry
    InvalidRequest,   // request parameters outside their invariants
    Cancelled,        // cooperative cancellation observed mid-pipeline
};

struct CollisionStatus {
    CollisionErrc code = CollisionErrc::Ok;
    std::string message;

    bool ok() const { return code == CollisionErrc::Ok; }
};

// Error class name as reported to callers ("EmptyInputError", ...).
const char* errc_name(CollisionErrc code);

// Set `st` and return false, so call sites can `return fail(st, ...)`.
bool fail(CollisionStatus& st, CollisionErrc code, const std::string& message);

// Cooperative cancellation flag. The pipeline polls it between stages and
// inside the simplifier loop; it never blocks.
struct CancelToken {
    std::atomic<bool> flag{false};

    void cancel() { flag.store(true, std::memory_order_relaxed); }
    bool cancelled() const { return flag.load(std::memory_order_relaxed); }
};

static inline bool is_cancelled(const CancelToken* tok) { return tok && tok->cancelled(); }
