// status.cpp — Names for CollisionErrc values.

#include "status.hpp"

const char* errc_name(CollisionErrc code) {
    switch (code) {
        case CollisionErrc::Ok:              return "Ok";
        case CollisionErrc::EmptyInput:      return "EmptyInputError";
        case CollisionErrc::DegenerateInput: return "DegenerateInputError";
        case CollisionErrc::InvalidRequest:  return "InvalidRequestError";
        case CollisionErrc::Cancelled:       return "CancelledError";
    }
    return "UnknownError";
}

bool fail(CollisionStatus& st, CollisionErrc code, const std::string& message) {
    st.code = code;
    st.message = message;
    return false;
}
