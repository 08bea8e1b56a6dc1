#include "monitoring.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <iostream>
#include <cmath>

namespace copysort::infra {

ThroughputWindow::ThroughputWindow(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 2))
{}

void ThroughputWindow::push(Sample sample) {
    std::lock_guard lock(mutex_);
    samples_.push_back(sample);
    while (samples_.size() > capacity_) {
        samples_.pop_front();
    }
}

auto ThroughputWindow::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return samples_.size();
}

auto ThroughputWindow::oldest() const -> std::optional<Sample> {
    std::lock_guard lock(mutex_);
    if (samples_.empty()) return std::nullopt;
    return samples_.front();
}

auto ThroughputWindow::bytes_per_second() const -> std::optional<double> {
    std::lock_guard lock(mutex_);
    if (samples_.size() < 2) return std::nullopt;

    const auto& first = samples_.front();
    const auto& last = samples_.back();
    const double seconds = std::chrono::duration<double>(last.time - first.time).count();
    if (seconds <= 0.0 || last.total_bytes < first.total_bytes) return std::nullopt;

    return static_cast<double>(last.total_bytes - first.total_bytes) / seconds;
}

auto ThroughputWindow::seconds_per_file() const -> std::optional<double> {
    std::lock_guard lock(mutex_);
    if (samples_.size() < 2) return std::nullopt;

    const double seconds =
        std::chrono::duration<double>(samples_.back().time - samples_.front().time).count();
    if (seconds <= 0.0) return std::nullopt;

    return seconds / static_cast<double>(samples_.size() - 1);
}

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , start_time_(std::chrono::steady_clock::now())
{
    if (enabled_) {
        start_rendering_thread_();
    }
}

ProgressMonitor::~ProgressMonitor() {
    finish();
}

void ProgressMonitor::set_total(std::uint64_t files) {
    total_files_.store(files, std::memory_order_relaxed);
}

void ProgressMonitor::advance(std::uint64_t files) {
    processed_files_.fetch_add(files, std::memory_order_relaxed);
}

void ProgressMonitor::record_transfer(std::uint64_t bytes) {
    {
        std::lock_guard lock(record_mutex_);
        const auto now = std::chrono::steady_clock::now();
        const auto total = processed_bytes_.fetch_add(bytes, std::memory_order_relaxed) + bytes;
        window_.push({now, total});
    }
    processed_files_.fetch_add(1, std::memory_order_relaxed);
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .total_files = total_files_.load(std::memory_order_relaxed),
        .processed_files = processed_files_.load(std::memory_order_relaxed),
        .processed_bytes = processed_bytes_.load(std::memory_order_relaxed),
        .start_time = start_time_
    };
}

void ProgressMonitor::finish() {
    if (shutdown_.exchange(true)) return;

    stop_rendering_thread_();
    if (enabled_) {
        render_();
        std::cout << "\n" << std::flush; // финальный перенос
    }
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    if (render_thread_) {
        render_thread_->request_stop();
        render_thread_.reset(); // join
    }
}

void ProgressMonitor::render_() const {
    if (!enabled_) return;

    auto stats = get_stats();
    if (stats.total_files == 0) return;

    const double file_progress = std::min(1.0,
        static_cast<double>(stats.processed_files) / static_cast<double>(stats.total_files));
    const int bar_width = 40;
    const int filled = static_cast<int>(file_progress * bar_width);

    // Мгновенная скорость по окну, а не средняя с начала
    const double bytes_per_sec = window_.bytes_per_second().value_or(0.0);

    std::string eta_str = "--:--";
    if (auto per_file = window_.seconds_per_file();
        per_file && stats.total_files > stats.processed_files) {
        const double eta_sec = *per_file * static_cast<double>(stats.total_files - stats.processed_files);
        if (std::isfinite(eta_sec)) {
            int seconds = static_cast<int>(eta_sec);
            int hours = seconds / 3600;
            int minutes = (seconds % 3600) / 60;
            seconds = seconds % 60;
            if (hours > 0) {
                eta_str = fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
            } else {
                eta_str = fmt::format("{:02d}:{:02d}", minutes, seconds);
            }
        }
    }

    std::cout << "\r\033[K"; // ANSI: очистить строку

    std::string bar = std::string(filled, '=');
    if (filled < bar_width) bar += '>';
    bar.resize(bar_width, ' ');

    std::cout << fmt::format(
        "Copying... [{}] {}/s | ETA: {} | {}/{} files",
        bar,
        human_size(static_cast<std::uint64_t>(bytes_per_sec)),
        eta_str,
        stats.processed_files,
        stats.total_files
    ) << std::flush;
}

auto human_size(std::uint64_t bytes) -> std::string {
    constexpr std::uint64_t unit = 1024;
    if (bytes < unit) {
        return fmt::format("{} B", bytes);
    }
    std::uint64_t div = unit;
    int exp = 0;
    for (auto n = bytes / unit; n >= unit; n /= unit) {
        div *= unit;
        ++exp;
    }
    return fmt::format("{:.1f} {}B", static_cast<double>(bytes) / static_cast<double>(div), "KMGTPE"[exp]);
}

auto human_duration(std::chrono::duration<double> elapsed) -> std::string {
    const double total = elapsed.count();
    const auto seconds = static_cast<long long>(total);
    if (total / 3600.0 > 1.0) {
        return fmt::format("{}h{}m", seconds / 3600, (seconds / 60) % 60);
    }
    if (total / 60.0 > 1.0) {
        return fmt::format("{}m{}s", seconds / 60, seconds % 60);
    }
    return fmt::format("{}s", seconds);
}

} // namespace copysort::infra
