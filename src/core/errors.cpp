#include "errors.hpp"

#include <cerrno>
#include <cstring>

namespace ListFile {

const char* to_string(ErrorKind kind) {
    switch( kind ){
        case ErrorKind::InvalidArgument: return "invalid argument";
        case ErrorKind::NotFound:        return "not found";
        case ErrorKind::AccessDenied:    return "access denied";
        case ErrorKind::Cancelled:       return "cancelled";
        case ErrorKind::Unexpected:      return "unexpected error";
    }
    return "?";
}

void throw_errno(int err, const std::string& msg) {
    std::string full = msg + ": " + strerror(err);
    switch( err ){
        case ENOENT:
        case ENOTDIR:
        case EISDIR:
            throw NotFound(full);
        case EACCES:
        case EPERM:
            throw AccessDenied(full);
        default:
            throw Unexpected(full);
    }
}

} // namespace ListFile
