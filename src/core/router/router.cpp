#include "router.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <exception>
#include <string>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace copysort::core {

namespace {

constexpr std::array<std::string_view, 6> kMediaExtensions = {
    ".jpg", ".jpeg", ".mp4", ".mov", ".avi", ".3gp",
};

constexpr std::array<std::string_view, 3> kExcludedExtensions = {
    ".png", ".webp", ".gif",
};

auto lower_extension(const std::filesystem::path& path) -> std::string {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

auto classify(const std::filesystem::path& path) -> FileClass {
    const auto ext = lower_extension(path);
    if (ext.empty()) return FileClass::Other;

    if (std::ranges::find(kExcludedExtensions, ext) != kExcludedExtensions.end()) {
        return FileClass::Excluded;
    }
    if (std::ranges::find(kMediaExtensions, ext) != kMediaExtensions.end()) {
        return FileClass::Media;
    }
    return FileClass::Other;
}

auto dated_destination(const std::filesystem::path& dest_root,
                       const extensions::CaptureTime& when,
                       const std::filesystem::path& basename) -> std::filesystem::path
{
    return dest_root / kSortedPhotosDir
        / fmt::format("{:04d}", when.year())
        / fmt::format("{:02d}", when.month())
        / fmt::format("{:02d}", when.day())
        / basename;
}

auto Router::capture_time_of(const std::filesystem::path& source) const
    -> infra::Result<extensions::CaptureTime>
{
    try {
        return extractor_.extract(source);
    } catch (const std::exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::MetadataFailed,
            fmt::format("Capture time of {}: {}", source.string(), e.what())));
    }
}

Router::Router(std::filesystem::path dest_root,
               const extensions::CaptureTimeExtractor& extractor)
    : dest_root_(std::move(dest_root)), extractor_(extractor) {}

auto Router::destination_for(const std::filesystem::path& source,
                             const std::filesystem::path& relative,
                             const std::timespec& mtime) const
    -> std::optional<std::filesystem::path>
{
    switch (classify(source)) {
        case FileClass::Excluded:
            return std::nullopt;

        case FileClass::Media: {
            auto when = capture_time_of(source);
            if (!when) {
                spdlog::debug("Using mtime for {}: {}", source.string(), when.error().message);
                return dated_destination(dest_root_, extensions::to_local_time(mtime),
                                         source.filename());
            }
            return dated_destination(dest_root_, *when, source.filename());
        }

        case FileClass::Other:
        default:
            return dest_root_ / relative;
    }
}

} // namespace copysort::core
