#pragma once

#include <string>

namespace LinCalc {

/// Return codes shared by every `call()` in LinCalc.
/// Zero means success; the remaining values classify the failure.
enum Status : int {
    Ok             = 0,
    EmptyInput     = 1,
    MalformedToken = 2,
    RaggedRows     = 3,
    ShapeMismatch  = 4,
    NotSquare      = 5,
    Singular       = 6,
    BadRequest     = 7,
    LibraryError   = 8
};

inline std::string status_name(int status) {
    switch (status) {
        case Ok:             return "Ok";
        case EmptyInput:     return "EmptyInput";
        case MalformedToken: return "MalformedToken";
        case RaggedRows:     return "RaggedRows";
        case ShapeMismatch:  return "ShapeMismatch";
        case NotSquare:      return "NotSquare";
        case Singular:       return "Singular";
        case BadRequest:     return "BadRequest";
        case LibraryError:   return "LibraryError";
        default:             return "Unknown";
    }
}

} // end namespace LinCalc
