#include "opens3/server/errors.hpp"

namespace opens3 {
namespace server {

const Error Error::Success(0, "");
const Error Error::ErrNotFound(1, "Resource not found");
const Error Error::ErrNoRoute(2, "Not Found");
const Error Error::ErrAlreadyExists(3, "Resource already exists");
const Error Error::ErrNotEmpty(4, "Resource is not empty");
const Error Error::ErrInvalidArgument(5, "Invalid argument");
const Error Error::ErrMalformedUpload(6, "Malformed upload request");
const Error Error::ErrMalformedJSON(7, "Malformed JSON body");
const Error Error::ErrUnauthorized(8, "Invalid authentication credentials");
const Error Error::ErrPermissionDenied(9, "Permission denied");
const Error Error::ErrNoStorage(10, "Storage service unavailable");
const Error Error::ErrInternal(11, "Internal server error");

Error Error::FromStoreError(const opens3::Error& err) {
    switch (err.code()) {
        case ErrorCode::OK:
            return Success;
        case ErrorCode::NotFound:
            return ErrNotFound.WithDetail(err.what());
        case ErrorCode::AlreadyExists:
            return ErrAlreadyExists.WithDetail(err.what());
        case ErrorCode::NotEmpty:
            return ErrNotEmpty.WithDetail(err.what());
        case ErrorCode::InvalidArgument:
            return ErrInvalidArgument.WithDetail(err.what());
        case ErrorCode::PermissionDenied:
            return ErrPermissionDenied.WithDetail(err.what());
        case ErrorCode::MetadataDecodeFailure:
        case ErrorCode::IOFailure:
        default:
            return ErrInternal.WithDetail(err.what());
    }
}

} // namespace server
} // namespace opens3
