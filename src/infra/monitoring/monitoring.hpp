#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <memory>
#include <thread>

namespace copysort::infra {

/// Скользящее окно последних (время, накопленные байты) для мгновенной
/// скорости и ETA. Хранит не более capacity образцов, старые вытесняются.
class ThroughputWindow {
public:
    using Clock = std::chrono::steady_clock;

    struct Sample {
        Clock::time_point time;
        std::uint64_t total_bytes = 0;
    };

    static constexpr std::size_t kDefaultCapacity = 20;

    explicit ThroughputWindow(std::size_t capacity = kDefaultCapacity);

    void push(Sample sample);

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }
    [[nodiscard]] auto oldest() const -> std::optional<Sample>;

    // Нужно хотя бы два образца с разным временем
    [[nodiscard]] auto bytes_per_second() const -> std::optional<double>;
    [[nodiscard]] auto seconds_per_file() const -> std::optional<double>;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<Sample> samples_;
};

class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t total_files = 0;
        std::uint64_t processed_files = 0;
        std::uint64_t processed_bytes = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void set_total(std::uint64_t files);

    // Уже перенесённые в прошлых запусках: только сдвигает полосу
    void advance(std::uint64_t files);

    // Один успешно перенесённый файл
    void record_transfer(std::uint64_t bytes);

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto window() const -> const ThroughputWindow& { return window_; }
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

    // Останавливает отрисовку и печатает последний кадр
    void finish();

private:
    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    std::atomic<std::uint64_t> processed_files_{0};
    std::atomic<std::uint64_t> processed_bytes_{0};
    std::atomic<std::uint64_t> total_files_{0};
    // Время, сумма и запись в окно берутся вместе: выборки монотонны
    std::mutex record_mutex_;
    ThroughputWindow window_;

    const bool enabled_;
    std::chrono::steady_clock::time_point start_time_;
    std::atomic<bool> shutdown_{false};
    std::unique_ptr<std::jthread> render_thread_;
};

// 1536 -> "1.5 KB"
[[nodiscard]] auto human_size(std::uint64_t bytes) -> std::string;

// 3725 -> "1h2m", 184 -> "3m4s", 5 -> "5s"
[[nodiscard]] auto human_duration(std::chrono::duration<double> elapsed) -> std::string;

} // namespace copysort::infra
