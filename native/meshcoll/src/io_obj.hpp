// io_obj.hpp — Minimal OBJ I/O for the meshcoll CLI.
//
// Reader:
// - `v x y z` positions and `f` records with any number of corners; only the
//   position index (before the first '/') is read. Negative indices are
//   relative to the vertices read so far, as OBJ defines them.
// - `o name` / `g name` start a new source mesh. Vertex numbering stays global
//   across the file; each source gets its own compacted vertex list.
// - Every other record (vt, vn, usemtl, s, ...) is ignored.
// Writer:
// - One `o` block per proxy, preceded by `# usage:`, `# layer_preset:` and,
//   when set, `# parent_bone:` comment records the importer-side tools read.
// - Indices are 1-based on disk and 0-based in memory.
//
#pragma once
#include "mesh.hpp"
#include "collision.hpp"
#include <string>
#include <vector>

// Load sources from an OBJ file. Sources that end up without vertices are
// dropped. Returns false with `err` set on I/O or parse failure.
bool load_obj(const std::string& path, std::vector<SourceMesh>& out, std::string& err);

// Write proxies as OBJ objects. Returns false with `err` set on I/O failure.
bool save_obj(const std::string& path, const ProxySet& proxies, std::string& err);
