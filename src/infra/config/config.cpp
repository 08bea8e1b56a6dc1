#include <vector>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <system_error>

#include <unistd.h>
#include <pwd.h>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace copysort::infra {
    void Config::merge_with(const Config& other) {
        if (other.workers) workers = other.workers;
        if (other.buffer_size) buffer_size = other.buffer_size;
        if (other.manifest) manifest = other.manifest;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.quiet) quiet = true;
        if (other.verbose) verbose = true;
    }

    static auto home_directory() -> std::optional<std::filesystem::path> {
        const char* home = std::getenv("HOME");
        if (home && *home) {
            return std::filesystem::path(home);
        }

        // Нет $HOME: спрашиваем базу пользователей
        long bufsize = ::sysconf(_SC_GETPW_R_SIZE_MAX);
        if (bufsize <= 0) bufsize = 16384;
        std::vector<char> buffer(static_cast<std::size_t>(bufsize));
        passwd pwd{};
        passwd* result = nullptr;
        if (::getpwuid_r(::getuid(), &pwd, buffer.data(), buffer.size(), &result) == 0
            && result && result->pw_dir && *result->pw_dir) {
            return std::filesystem::path(result->pw_dir);
        }
        return std::nullopt;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".copysort.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "copysort" / "config.yaml");
        } else if (auto home = home_directory()) {
            paths.push_back(*home / ".config" / "copysort" / "config.yaml");
        }

        return paths;
    }

    auto load_config_from_path(const std::filesystem::path& path)
        -> std::expected<Config, std::string>
    {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["workers"]) cfg.workers = config["workers"].as<std::uint32_t>();
            if (config["buffer_size"]) cfg.buffer_size = config["buffer_size"].as<std::size_t>();
            if (config["manifest"]) cfg.manifest = config["manifest"].as<std::string>();

            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["verbose"]) cfg.verbose = config["verbose"].as<bool>();

            if (cfg.workers && *cfg.workers == 0) {
                return std::unexpected(fmt::format("{}: workers must be positive", path.string()));
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const YAML::Exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_config_from_path(path);
        }

        // Файл не найден — возвращаем пустой конфиг (не ошибка!)
        return Config{};
    }

    [[nodiscard]]
    auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.workers = args.workers;
        cfg.buffer_size = args.buffer_size;
        if (args.manifest) cfg.manifest = std::filesystem::path(*args.manifest);
        cfg.progress = args.progress;
        cfg.quiet = args.quiet;
        cfg.verbose = args.verbose;
        return cfg;
    }

    auto resolve_manifest_path(const Config& config) -> Result<std::filesystem::path> {
        if (config.manifest && !config.manifest->empty()) {
            return *config.manifest;
        }

        auto home = home_directory();
        if (!home) {
            return std::unexpected(make_error(ErrorCode::HomeNotFound,
                "Failed to get user home dir"));
        }
        return *home / kManifestFileName;
    }

} // namespace copysort::infra
