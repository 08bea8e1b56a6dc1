// include/copysort/extensions/manifest.hpp
#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include "infra/error_handler/error.hpp"

namespace copysort::extensions {

// Относительные пути (от корня источника), уже перенесённые ранее
using ManifestSet = std::unordered_set<std::string>;

/// Читает манифест целиком. Отсутствующий или нечитаемый файл даёт
/// пустое множество: первый запуск без истории это нормальное состояние.
[[nodiscard]] auto load_manifest(const std::filesystem::path& manifest_file)
    -> ManifestSet;

/// Дописывает записи в манифест. Безопасен для вызова из нескольких
/// потоков: каждая строка пишется и сбрасывается под одной блокировкой,
/// поэтому сбой процесса теряет не более текущей записи.
class ManifestWriter {
public:
    [[nodiscard]] static auto open(const std::filesystem::path& manifest_file)
        -> infra::Result<ManifestWriter>;

    ManifestWriter(ManifestWriter&&) noexcept = default;
    ManifestWriter& operator=(ManifestWriter&&) noexcept = default;

    [[nodiscard]] auto append(std::string_view relative_path) -> infra::VoidResult;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    ManifestWriter(std::filesystem::path path, std::ofstream stream);

    std::filesystem::path path_;
    std::ofstream stream_;
    // unique_ptr, чтобы writer оставался перемещаемым
    std::unique_ptr<std::mutex> mutex_;
};

} // namespace copysort::extensions
