#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace copysort::infra {

enum class ErrorCode {
    // Фатальные ошибки запуска (процесс завершается, ничего не копируется)
    InvalidArguments,
    HomeNotFound,
    ManifestUnavailable,
    InvalidConfig,

    // Ошибки отдельного задания (задание брошено, повтор при следующем запуске)
    FileNotFound,
    PermissionDenied,
    ReadFailed,
    WriteFailed,
    MetadataFailed,

    // Отсутствие даты съёмки, всегда заменяется на mtime
    NoMetadata,

    Unknown,
};

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
    [[nodiscard]] auto what() const -> const char*;
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Ошибка из errno / std::error_code с текстом системы
[[nodiscard]] auto make_system_error(
    ErrorCode code,
    std::string_view context,
    std::error_code ec,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат.
// Фатальные пишутся на уровне err, ошибки заданий только на debug.
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace copysort::infra
