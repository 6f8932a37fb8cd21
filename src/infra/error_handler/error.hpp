#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace fsort::infra {

enum class ErrorCode {
    // Фатальные ошибки (запуск прерывается)
    ConfigLoad,
    InvalidSourceDirectory,
    Interrupted,

    // Ошибки одного файла (не влияют на соседние)
    NotFound,
    AlreadyExists,
    PermissionDenied,
    IoError,

    Unknown,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
};

// Псевдонимы для удобства
template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Переводит системную ошибку в код ошибки файла.
/// ENOENT -> NotFound, EEXIST -> AlreadyExists, EACCES/EPERM -> PermissionDenied,
/// всё остальное -> IoError.
[[nodiscard]] auto from_error_code(const std::error_code& ec) -> ErrorCode;

// То же, но сразу с сообщением: "<context>: <ec.message()>"
[[nodiscard]] auto make_io_error(
    const std::error_code& ec,
    std::string_view context,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace fsort::infra
