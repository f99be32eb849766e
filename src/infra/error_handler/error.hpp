#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace fcopy::infra {

enum class ErrorCode {
    // Фатальные ошибки (операция прекращается)
    FileNotFound,
    PermissionDenied,
    InvalidPath,
    UnsupportedFeature,
    SameFile,       // источник и назначение - один и тот же файл
    SpecialFile,    // именованный канал (FIFO)

    // Восстанавливаемые
    DiskFull,
    FileLocked,
    ChecksumMismatch,

    // Системные
    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::error_code os_error; // исходный errno, если ошибка пришла от ОС
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

    Error(ErrorCode c, std::string_view msg, std::error_code ec,
          const std::source_location& loc = std::source_location::current())
        : Error(c, msg, loc)
    {
        os_error = ec;
    }

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto what() const -> const char*;

    /// errno исходной системной ошибки, 0 если ошибка не от ОС.
    [[nodiscard]] auto os_errno() const -> int {
        return os_error.category() == std::system_category() ? os_error.value() : 0;
    }
};

// Псевдонимы для удобства
template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

// Вспомогательные функции-конструкторы
[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Ошибка ОС: errno сохраняется без изменений в Error::os_error,
/// code выбирается по errno (ENOENT -> FileNotFound и т.д.).
[[nodiscard]] auto make_os_error(
    int err,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto code_from_errno(int err) -> ErrorCode;

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace fcopy::infra
