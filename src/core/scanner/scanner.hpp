#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "../../extensions/manifest.hpp"

namespace copysort::core {

// Любой путь, содержащий эту подстроку, пропускается целиком
inline constexpr std::string_view kRecycleBinMarker = "RECYCLE.BIN";

struct ScanResult {
    std::vector<std::filesystem::path> jobs;   // абсолютные пути, порядок обхода
    std::uint64_t already_copied = 0;          // найдены в манифесте
};

// Ключ манифеста: путь файла относительно корня источника
[[nodiscard]] auto relative_key(const std::filesystem::path& source_root,
                                const std::filesystem::path& file) -> std::string;

[[nodiscard]] auto is_excluded_path(const std::filesystem::path& path) -> bool;

/// Рекурсивно обходит source_root. Каталоги, которые не удалось прочитать,
/// молча пропускаются. Файлы из манифеста только подсчитываются.
[[nodiscard]] auto scan_source(const std::filesystem::path& source_root,
                               const extensions::ManifestSet& manifest)
    -> ScanResult;

} // namespace copysort::core
