#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <string_view>
#include "infra/error_handler/error.hpp"

namespace copysort::extensions {

// Момент съёмки как локальное гражданское время (без часового пояса),
// в том виде, в каком его пишет камера.
struct CaptureTime {
    std::chrono::local_seconds value{};

    [[nodiscard]] auto date() const -> std::chrono::year_month_day {
        return std::chrono::year_month_day{std::chrono::floor<std::chrono::days>(value)};
    }
    [[nodiscard]] auto year() const -> int { return static_cast<int>(date().year()); }
    [[nodiscard]] auto month() const -> unsigned { return static_cast<unsigned>(date().month()); }
    [[nodiscard]] auto day() const -> unsigned { return static_cast<unsigned>(date().day()); }

    [[nodiscard]] static auto from_civil(int year, unsigned month, unsigned day,
                                         int hour = 0, int minute = 0, int second = 0)
        -> CaptureTime;

    friend auto operator==(const CaptureTime&, const CaptureTime&) -> bool = default;
};

/// Источник даты съёмки, встроенной в медиафайл.
/// Ошибка (обычно ErrorCode::NoMetadata) означает, что нужно
/// использовать время модификации файла.
class CaptureTimeExtractor {
public:
    virtual ~CaptureTimeExtractor() = default;

    [[nodiscard]] virtual auto extract(const std::filesystem::path& path) const
        -> infra::Result<CaptureTime> = 0;
};

// Читает EXIF через Exiv2: DateTimeOriginal, затем Image.DateTime
class Exiv2CaptureTimeExtractor final : public CaptureTimeExtractor {
public:
    Exiv2CaptureTimeExtractor();

    [[nodiscard]] auto extract(const std::filesystem::path& path) const
        -> infra::Result<CaptureTime> override;
};

// "YYYY:MM:DD HH:MM:SS"
[[nodiscard]] auto parse_exif_datetime(std::string_view text)
    -> infra::Result<CaptureTime>;

// Время файловой системы в локальном часовом поясе
[[nodiscard]] auto to_local_time(const std::timespec& ts) -> CaptureTime;

} // namespace copysort::extensions
