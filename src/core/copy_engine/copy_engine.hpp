#pragma once

#include <filesystem>
#include <span>
#include <string>
#include <vector>
#include <expected>
#include <atomic>
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"
#include "../../extensions/manifest.hpp"
#include "../router/router.hpp"

namespace copysort::core {

enum class JobOutcome {
    Committed,  // скопирован, записан в манифест
    Excluded,   // исключённое расширение, ничего не сделано
};

struct TransferStatsSnapshot {
    std::uint64_t files_copied = 0;
    std::uint64_t bytes_copied = 0;
    std::uint64_t files_excluded = 0;
    std::uint64_t files_failed = 0;
};

struct TransferStats {
    std::atomic<std::uint64_t> files_copied{0};
    std::atomic<std::uint64_t> bytes_copied{0};
    std::atomic<std::uint64_t> files_excluded{0};
    std::atomic<std::uint64_t> files_failed{0};

    TransferStats() = default;

    // Запрещаем копирование и перемещение (из-за atomic)
    TransferStats(const TransferStats&) = delete;
    TransferStats& operator=(const TransferStats&) = delete;
    TransferStats(TransferStats&&) = delete;
    TransferStats& operator=(TransferStats&&) = delete;

    [[nodiscard]] auto snapshot() const -> TransferStatsSnapshot;
};

/// Делит задания на непрерывные куски по n / workers, последний кусок
/// забирает остаток. Если заданий меньше, чем workers, кусков столько же,
/// сколько заданий. Каждое задание попадает ровно в один кусок.
[[nodiscard]] auto partition_jobs(std::span<const std::filesystem::path> jobs,
                                  std::size_t workers)
    -> std::vector<std::span<const std::filesystem::path>>;

class TransferEngine {
public:
    TransferEngine(const infra::Config& config,
                   std::filesystem::path source_root,
                   const Router& router,
                   extensions::ManifestWriter& manifest,
                   infra::ProgressMonitor& monitor);

    /// Разбивает задания по рабочим и ждёт, пока все куски не будут пройдены.
    /// Ошибки отдельных файлов не прерывают прогон: файл остаётся вне
    /// манифеста и будет взят следующим запуском.
    [[nodiscard]] auto run(const std::vector<std::filesystem::path>& jobs)
        -> TransferStatsSnapshot;

    // Одно задание: stat -> маршрут -> копия -> времена -> манифест
    [[nodiscard]] auto transfer(const std::filesystem::path& source)
        -> infra::Result<JobOutcome>;

    [[nodiscard]] auto stats() const -> TransferStatsSnapshot { return stats_.snapshot(); }

private:
    void process_chunk(std::span<const std::filesystem::path> chunk);

    const infra::Config& config_;
    std::filesystem::path source_root_;
    const Router& router_;
    extensions::ManifestWriter& manifest_;
    infra::ProgressMonitor& monitor_;

    TransferStats stats_{};
};

} // namespace copysort::core
