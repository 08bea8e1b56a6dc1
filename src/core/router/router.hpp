#pragma once

#include <ctime>
#include <filesystem>
#include <optional>
#include <string_view>
#include "../../extensions/capture_time.hpp"

namespace copysort::core {

enum class FileClass {
    Media,      // фото/видео: раскладка по дате съёмки
    Excluded,   // не копируется вовсе
    Other,      // копируется с сохранением относительного пути
};

inline constexpr std::string_view kSortedPhotosDir = "sorted_photos";

// По расширению без учёта регистра
[[nodiscard]] auto classify(const std::filesystem::path& path) -> FileClass;

// <dest_root>/sorted_photos/YYYY/MM/DD/<basename>
[[nodiscard]] auto dated_destination(const std::filesystem::path& dest_root,
                                     const extensions::CaptureTime& when,
                                     const std::filesystem::path& basename)
    -> std::filesystem::path;

class Router {
public:
    Router(std::filesystem::path dest_root,
           const extensions::CaptureTimeExtractor& extractor);

    /// Куда копировать source. nullopt для исключённых расширений.
    /// Для фото/видео дата берётся из метаданных, при любой ошибке из mtime.
    [[nodiscard]] auto destination_for(const std::filesystem::path& source,
                                       const std::filesystem::path& relative,
                                       const std::timespec& mtime) const
        -> std::optional<std::filesystem::path>;

    [[nodiscard]] auto dest_root() const -> const std::filesystem::path& { return dest_root_; }

private:
    // Исключения реализации extract() превращаются в ошибку
    [[nodiscard]] auto capture_time_of(const std::filesystem::path& source) const
        -> infra::Result<extensions::CaptureTime>;

    std::filesystem::path dest_root_;
    const extensions::CaptureTimeExtractor& extractor_;
};

} // namespace copysort::core
