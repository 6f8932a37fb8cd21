#include "error.hpp"
#include <cstdlib>
#include <fmt/core.h>

namespace fsort::infra {

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::ConfigLoad:             return "ConfigLoad";
        case ErrorCode::InvalidSourceDirectory: return "InvalidSourceDirectory";
        case ErrorCode::Interrupted:            return "Interrupted";
        case ErrorCode::NotFound:               return "NotFound";
        case ErrorCode::AlreadyExists:          return "AlreadyExists";
        case ErrorCode::PermissionDenied:       return "PermissionDenied";
        case ErrorCode::IoError:                return "IOError";
        case ErrorCode::Unknown:                break;
    }
    return "Unknown";
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::ConfigLoad:
        case ErrorCode::InvalidSourceDirectory:
        case ErrorCode::Interrupted:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    if (code == ErrorCode::Interrupted) return 130; // SIGINT
    return EXIT_FAILURE;
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

ErrorCode from_error_code(const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory) {
        return ErrorCode::NotFound;
    }
    if (ec == std::errc::file_exists) {
        return ErrorCode::AlreadyExists;
    }
    if (ec == std::errc::permission_denied ||
        ec == std::errc::operation_not_permitted) {
        return ErrorCode::PermissionDenied;
    }
    return ErrorCode::IoError;
}

Error make_io_error(const std::error_code& ec, std::string_view context,
                    const std::source_location& loc) {
    return Error{from_error_code(ec), fmt::format("{}: {}", context, ec.message()), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level, "{}: {}", to_string(err.code), err.message);
    spdlog::debug("  at {}:{} in {}", err.file, err.line, err.function);
    return std::move(err);
}

} // namespace fsort::infra
