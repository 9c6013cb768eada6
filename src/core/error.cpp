#include "dtx/core/error.hpp"

#include <cerrno>
#include <system_error>

namespace dtx {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::DeviceUnavailable: return "DeviceUnavailable";
        case ErrorKind::ToolMissing: return "ToolMissing";
        case ErrorKind::PathInvalid: return "PathInvalid";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::PipelineStageFailed: return "PipelineStageFailed";
        case ErrorKind::UserCancelled: return "UserCancelled";
        case ErrorKind::SizeProbeFailed: return "SizeProbeFailed";
        case ErrorKind::ConfigInvalid: return "ConfigInvalid";
        case ErrorKind::Internal: return "Internal";
    }
    return "Unknown";
}

std::string Error::describe() const {
    std::string text = to_string(kind);
    if (!message.empty()) {
        text += ": ";
        text += message;
    }
    return text;
}

Error system_error(ErrorKind kind, const std::string& what, int error_number) {
    return Error(kind, what + ": " + std::system_category().message(error_number));
}

ErrorKind kind_from_errno(int error_number) noexcept {
    switch (error_number) {
        case ENOENT:
        case ENOTDIR:
            return ErrorKind::PathInvalid;
        case EACCES:
        case EPERM:
            return ErrorKind::PermissionDenied;
        default:
            return ErrorKind::Internal;
    }
}

} // namespace dtx
