#include "copy_engine.hpp"
#include <algorithm>
#include <exception>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../infra/thread_pool/thread_pool.hpp"
#include "../../adapters/fs.hpp"
#include "../../extensions/metadata.hpp"
#include "../scanner/scanner.hpp"

namespace copysort::core {

auto TransferStats::snapshot() const -> TransferStatsSnapshot {
    return TransferStatsSnapshot{
        .files_copied = files_copied.load(),
        .bytes_copied = bytes_copied.load(),
        .files_excluded = files_excluded.load(),
        .files_failed = files_failed.load()
    };
}

auto partition_jobs(std::span<const std::filesystem::path> jobs, std::size_t workers)
    -> std::vector<std::span<const std::filesystem::path>>
{
    std::vector<std::span<const std::filesystem::path>> chunks;
    if (jobs.empty()) return chunks;

    workers = std::clamp<std::size_t>(workers, 1, jobs.size());
    const std::size_t chunk_size = jobs.size() / workers;
    chunks.reserve(workers);

    for (std::size_t i = 0; i < workers; ++i) {
        const std::size_t start = i * chunk_size;
        // Последний кусок забирает остаток
        const std::size_t count = (i + 1 == workers) ? jobs.size() - start : chunk_size;
        chunks.push_back(jobs.subspan(start, count));
    }
    return chunks;
}

TransferEngine::TransferEngine(const infra::Config& config,
                               std::filesystem::path source_root,
                               const Router& router,
                               extensions::ManifestWriter& manifest,
                               infra::ProgressMonitor& monitor)
    : config_(config)
    , source_root_(std::move(source_root))
    , router_(router)
    , manifest_(manifest)
    , monitor_(monitor) {}

auto TransferEngine::run(const std::vector<std::filesystem::path>& jobs)
    -> TransferStatsSnapshot
{
    // Статическое разбиение до старта: общей очереди заданий нет
    const auto chunks = partition_jobs(jobs, config_.worker_count());
    spdlog::debug("Dispatching {} jobs to {} workers", jobs.size(), chunks.size());

    {
        infra::ThreadPool pool{chunks.size()};
        for (const auto chunk : chunks) {
            pool.enqueue([this, chunk]() { process_chunk(chunk); });
        }
        pool.wait();
    }

    return stats_.snapshot();
}

void TransferEngine::process_chunk(std::span<const std::filesystem::path> chunk) {
    for (const auto& source : chunk) {
        infra::Result<JobOutcome> res;
        try {
            res = transfer(source);
        } catch (const std::exception& e) {
            // Задание брошено, остальной кусок продолжается
            res = std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                fmt::format("{}: {}", source.string(), e.what())));
        }
        if (!res) {
            stats_.files_failed.fetch_add(1, std::memory_order_relaxed);
            (void)infra::log_and_return(std::move(res.error()));
        } else if (*res == JobOutcome::Excluded) {
            stats_.files_excluded.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

auto TransferEngine::transfer(const std::filesystem::path& source)
    -> infra::Result<JobOutcome>
{
    auto info = adapters::fs::stat_file(source);
    if (!info) {
        return std::unexpected(std::move(info.error()));
    }

    const auto relative = relative_key(source_root_, source);
    const auto destination = router_.destination_for(source, relative, info->mtime);
    if (!destination) {
        return JobOutcome::Excluded;
    }

    if (auto dirs = adapters::fs::ensure_parent_directories(*destination); !dirs) {
        return std::unexpected(std::move(dirs.error()));
    }

    const auto strategy = adapters::fs::select_strategy(info->size);
    auto copied = adapters::fs::copy_file(source, *destination, strategy,
                                          config_.buffer_size.value_or(adapters::fs::kDefaultBufferSize));
    if (!copied) {
        return std::unexpected(std::move(copied.error()));
    }

    if (auto times = extensions::apply_timestamps(*destination, info->mtime); !times) {
        return std::unexpected(std::move(times.error()));
    }

    stats_.files_copied.fetch_add(1, std::memory_order_relaxed);
    stats_.bytes_copied.fetch_add(*copied, std::memory_order_relaxed);
    monitor_.record_transfer(*copied);

    // Файл уже на месте; без записи он просто будет скопирован повторно
    if (auto appended = manifest_.append(relative); !appended) {
        spdlog::warn("{}", appended.error().message);
    }

    return JobOutcome::Committed;
}

} // namespace copysort::core
