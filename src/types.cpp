#include "opens3/types.hpp"

namespace opens3 {

std::string ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                    return "OK";
        case ErrorCode::NotFound:              return "NotFound";
        case ErrorCode::AlreadyExists:         return "AlreadyExists";
        case ErrorCode::NotEmpty:              return "NotEmpty";
        case ErrorCode::IOFailure:             return "IOFailure";
        case ErrorCode::PermissionDenied:      return "PermissionDenied";
        case ErrorCode::InvalidArgument:       return "InvalidArgument";
        case ErrorCode::MetadataDecodeFailure: return "MetadataDecodeFailure";
        default: return "Unknown";
    }
}

} // namespace opens3
