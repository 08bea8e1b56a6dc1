#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>
#include "../error_handler/error.hpp"

namespace copysort::args_parser{
    struct CLIArgs;
}

namespace copysort::infra {

inline constexpr std::uint32_t kDefaultWorkers = 8;
inline constexpr const char* kManifestFileName = ".copy_sort_manifest.txt";

struct Config {
    // I/O
    std::optional<std::uint32_t> workers;
    std::optional<std::size_t> buffer_size;   // bytes

    // Paths
    std::optional<std::filesystem::path> manifest;

    // Behavior
    bool progress = true;
    bool quiet = false;
    bool verbose = false;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);

    [[nodiscard]] auto worker_count() const -> std::uint32_t {
        return workers.value_or(kDefaultWorkers);
    }
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.copysort.yaml
///   2. $XDG_CONFIG_HOME/copysort/config.yaml
///   3. ~/.config/copysort/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

// Разбор одного конкретного файла
[[nodiscard]] auto load_config_from_path(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

/// Путь к манифесту: явный из конфига, иначе ~/.copy_sort_manifest.txt.
/// HomeNotFound, если домашний каталог не определяется.
[[nodiscard]] auto resolve_manifest_path(const Config& config)
    -> Result<std::filesystem::path>;

} // namespace copysort::infra
