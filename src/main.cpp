#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/copy_engine/copy_engine.hpp"
#include "core/router/router.hpp"
#include "core/scanner/scanner.hpp"
#include "extensions/capture_time.hpp"
#include "extensions/manifest.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

using GIT = copysort::build_info::GitInfo;
using STATS = copysort::core::TransferStatsSnapshot;

constexpr auto load_from_cli = copysort::infra::config_from_cli;
constexpr auto load_config_file = copysort::infra::load_config_from_file;
constexpr auto args_parser = copysort::args_parser::parse_args;
constexpr auto git = copysort::build_info::get_git_info();

static auto
__out_git_verse(const GIT& git)
-> void {
    fmt::print("copysort {}\n", git.version);
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

static auto
__out_summary(const STATS& stats, std::chrono::duration<double> elapsed)
-> void {
    using copysort::infra::human_duration;
    using copysort::infra::human_size;

    const double seconds = elapsed.count();
    const double mb_per_sec = seconds > 0
        ? (static_cast<double>(stats.bytes_copied) / 1024.0 / 1024.0) / seconds
        : 0.0;

    fmt::print("\nDone: {} files, {} copied in {} ({:.2f} MB/s)\n",
               stats.files_copied,
               human_size(stats.bytes_copied),
               human_duration(elapsed),
               mb_per_sec);

    if (stats.files_excluded + stats.files_failed > 0) {
        fmt::print("Skipped: {} excluded, {} failed (failed files are retried on the next run)\n",
                   stats.files_excluded, stats.files_failed);
    }
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return args_opt.error(); // --help или ошибка разбора
        }
        const auto& args = *args_opt;

        if (args.version) {
            __out_git_verse(git);
            return 0;
        }

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));

        if (config.verbose) {
            spdlog::set_level(spdlog::level::debug);
        } else if (config.quiet) {
            spdlog::set_level(spdlog::level::warn);
        }

        const std::filesystem::path source_root(args.source);
        const std::filesystem::path destination_root(args.destination);

        auto manifest_path = copysort::infra::resolve_manifest_path(config);
        if (!manifest_path) {
            auto err = copysort::infra::log_and_return(std::move(manifest_path.error()));
            return err.to_exit_code();
        }
        fmt::print("Using manifest {}\n", manifest_path->string());

        const auto already_copied = copysort::extensions::load_manifest(*manifest_path);

        spdlog::debug("Scanning {}...", source_root.string());
        auto scan = copysort::core::scan_source(source_root, already_copied);

        if (scan.jobs.empty()) {
            fmt::print("No files to copy. You're done!\n");
            return 0;
        }

        auto manifest = copysort::extensions::ManifestWriter::open(*manifest_path);
        if (!manifest) {
            auto err = copysort::infra::log_and_return(std::move(manifest.error()));
            return err.to_exit_code();
        }

        const auto start_time = std::chrono::steady_clock::now();

        copysort::infra::ProgressMonitor monitor(config.progress, config.quiet);
        monitor.set_total(scan.jobs.size() + scan.already_copied);
        monitor.advance(scan.already_copied);

        copysort::extensions::Exiv2CaptureTimeExtractor extractor;
        copysort::core::Router router(destination_root, extractor);
        copysort::core::TransferEngine engine(config, source_root, router, *manifest, monitor);

        const auto stats = engine.run(scan.jobs);
        monitor.finish();

        const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time);

        // Пропущенные файлы не делают запуск неудачным
        __out_summary(stats, elapsed);
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
