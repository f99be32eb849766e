#include "error.hpp"
#include <cerrno>
#include <fmt/core.h>

namespace fcopy::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::FileNotFound:
        case ErrorCode::PermissionDenied:
        case ErrorCode::InvalidPath:
        case ErrorCode::UnsupportedFeature:
        case ErrorCode::SameFile:
        case ErrorCode::SpecialFile:
            return true;
        default:
            return false;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

ErrorCode code_from_errno(int err) {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return ErrorCode::FileNotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PermissionDenied;
        case ENAMETOOLONG:
        case ELOOP:
        case EISDIR:
            return ErrorCode::InvalidPath;
        case ENOSPC:
        case EDQUOT:
        case EFBIG:
            return ErrorCode::DiskFull;
        case ETXTBSY:
        case EBUSY:
            return ErrorCode::FileLocked;
        case ENOTSUP:
#if EOPNOTSUPP != ENOTSUP
        case EOPNOTSUPP:
#endif
        case ENOSYS:
            return ErrorCode::UnsupportedFeature;
        default:
            return ErrorCode::Unknown;
    }
}

Error make_os_error(int err, std::string_view message,
                    const std::source_location& loc) {
    std::error_code ec(err, std::system_category());
    return Error{code_from_errno(err),
                 fmt::format("{}: {}", message, ec.message()),
                 ec, loc};
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::FileNotFound:       return "file not found";
        case ErrorCode::PermissionDenied:   return "permission denied";
        case ErrorCode::InvalidPath:        return "invalid path";
        case ErrorCode::UnsupportedFeature: return "unsupported feature";
        case ErrorCode::SameFile:           return "same file";
        case ErrorCode::SpecialFile:        return "special file";
        case ErrorCode::DiskFull:           return "disk full";
        case ErrorCode::FileLocked:         return "file locked";
        case ErrorCode::ChecksumMismatch:   return "checksum mismatch";
        case ErrorCode::Unknown:            break;
    }
    return "unknown";
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace fcopy::infra
