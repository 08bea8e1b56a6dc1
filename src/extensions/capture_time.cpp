#include "capture_time.hpp"

#include <array>
#include <charconv>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <exiv2/exiv2.hpp>

namespace copysort::extensions {

namespace {

// Ключи в порядке предпочтения
constexpr std::array<const char*, 2> kDateKeys = {
    "Exif.Photo.DateTimeOriginal",
    "Exif.Image.DateTime",
};

auto parse_field(std::string_view text, std::size_t pos, std::size_t len, int& out) -> bool {
    const char* first = text.data() + pos;
    const char* last = first + len;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

} // namespace

auto CaptureTime::from_civil(int year, unsigned month, unsigned day,
                             int hour, int minute, int second) -> CaptureTime
{
    using namespace std::chrono;
    const local_days d{year_month_day{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}}};
    return CaptureTime{d + hours{hour} + minutes{minute} + seconds{second}};
}

auto parse_exif_datetime(std::string_view text) -> infra::Result<CaptureTime> {
    // Камеры иногда дописывают '\0' или пробелы
    while (!text.empty() && (text.back() == '\0' || text.back() == ' ')) {
        text.remove_suffix(1);
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    const bool shape_ok = text.size() == 19
        && text[4] == ':' && text[7] == ':' && text[10] == ' '
        && text[13] == ':' && text[16] == ':';

    if (!shape_ok
        || !parse_field(text, 0, 4, year) || !parse_field(text, 5, 2, month)
        || !parse_field(text, 8, 2, day) || !parse_field(text, 11, 2, hour)
        || !parse_field(text, 14, 2, minute) || !parse_field(text, 17, 2, second)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NoMetadata,
            fmt::format("Malformed EXIF datetime '{}'", text)));
    }

    const std::chrono::year_month_day ymd{std::chrono::year{year},
                                          std::chrono::month{static_cast<unsigned>(month)},
                                          std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NoMetadata,
            fmt::format("Invalid EXIF datetime '{}'", text)));
    }

    return CaptureTime::from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day),
                                   hour, minute, second);
}

auto to_local_time(const std::timespec& ts) -> CaptureTime {
    std::tm tm{};
    const std::time_t secs = ts.tv_sec;
    if (::localtime_r(&secs, &tm) == nullptr && ::gmtime_r(&secs, &tm) == nullptr) {
        // Год не помещается в tm: кладём в 1970-01-01, а не в несуществующий день
        spdlog::debug("Timestamp {} is out of range", static_cast<long long>(secs));
        return CaptureTime::from_civil(1970, 1, 1);
    }
    return CaptureTime::from_civil(tm.tm_year + 1900,
                                   static_cast<unsigned>(tm.tm_mon + 1),
                                   static_cast<unsigned>(tm.tm_mday),
                                   tm.tm_hour, tm.tm_min, tm.tm_sec);
}

Exiv2CaptureTimeExtractor::Exiv2CaptureTimeExtractor() {
    // Повреждённые файлы не должны засорять stderr
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::mute);
    // Обязательно до использования из нескольких потоков
    Exiv2::XmpParser::initialize();
}

auto Exiv2CaptureTimeExtractor::extract(const std::filesystem::path& path) const
    -> infra::Result<CaptureTime>
{
    try {
        auto image = Exiv2::ImageFactory::open(path.string());
        image->readMetadata();
        const auto& exif_data = image->exifData();

        for (const char* key : kDateKeys) {
            auto it = exif_data.findKey(Exiv2::ExifKey(key));
            if (it == exif_data.end()) continue;

            auto parsed = parse_exif_datetime(it->toString());
            if (parsed) return parsed;
            spdlog::debug("{}: {}", path.string(), parsed.error().message);
        }
    } catch (const Exiv2::Error& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::MetadataFailed,
            fmt::format("Exiv2 cannot read {}: {}", path.string(), e.what())));
    } catch (const std::exception& e) {
        // Safe:: арифметика и аллокации на битых файлах
        return std::unexpected(infra::make_error(infra::ErrorCode::MetadataFailed,
            fmt::format("Exiv2 failed on {}: {}", path.string(), e.what())));
    }

    return std::unexpected(infra::make_error(infra::ErrorCode::NoMetadata,
        fmt::format("No capture time in {}", path.string())));
}

} // namespace copysort::extensions
