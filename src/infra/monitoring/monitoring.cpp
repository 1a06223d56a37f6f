#include "monitoring.hpp"
#include <fmt/core.h>
#include <cstdio>

namespace objcp::infra {

namespace {

auto human_rate(double bytes_per_sec) -> std::string {
    const char* unit = "B/s";
    double speed = bytes_per_sec;
    if (speed > 1024.0 * 1024 * 1024) { speed /= 1024.0 * 1024 * 1024; unit = "GiB/s"; }
    else if (speed > 1024.0 * 1024) { speed /= 1024.0 * 1024; unit = "MiB/s"; }
    else if (speed > 1024.0) { speed /= 1024.0; unit = "KiB/s"; }
    return fmt::format("{:.1f} {}", speed, unit);
}

} // namespace

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , start_time_(std::chrono::steady_clock::now())
{}

ProgressMonitor::~ProgressMonitor() {
    stop();
}

void ProgressMonitor::start() {
    if (!enabled_ || render_thread_) {
        return;
    }
    start_time_ = std::chrono::steady_clock::now();
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void ProgressMonitor::stop() {
    if (!render_thread_) {
        return;
    }
    render_thread_->request_stop();
    render_thread_.reset();   // join
    render_();
    std::fputs("\n", stdout); // финальный перенос
    std::fflush(stdout);
}

void ProgressMonitor::update(std::uint64_t items, std::uint64_t bytes, std::uint64_t failed) {
    processed_items_ += items;
    processed_bytes_ += bytes;
    failed_items_ += failed;
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .processed_items = processed_items_.load(),
        .failed_items = failed_items_.load(),
        .processed_bytes = processed_bytes_.load(),
        .start_time = start_time_
    };
}

void ProgressMonitor::render_() const {
    if (!enabled_) return;

    const auto stats = get_stats();
    const auto elapsed_sec = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - stats.start_time).count();
    const double bytes_per_sec = elapsed_sec > 0 ? stats.processed_bytes / elapsed_sec : 0.0;

    // ANSI: очистить строку
    fmt::print("\r\033[K[{} items, {} failed] {:.2f} MiB | {}",
               stats.processed_items,
               stats.failed_items,
               stats.processed_bytes / 1024.0 / 1024.0,
               human_rate(bytes_per_sec));
    std::fflush(stdout);
}

} // namespace objcp::infra
