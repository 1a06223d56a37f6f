#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace objcp::infra {

// Live progress line. Totals are unknown up front because sources are
// enumerated lazily, so only counts and rates are shown.
class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t processed_items = 0;
        std::uint64_t failed_items = 0;
        std::uint64_t processed_bytes = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    // Starts the render thread. Kept separate from the constructor so that
    // worker processes can be forked before any extra thread exists.
    void start();
    void stop();

    void update(std::uint64_t items = 0, std::uint64_t bytes = 0, std::uint64_t failed = 0);

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

private:
    void render_() const;

    // Атомики для thread-safe обновления
    std::atomic<std::uint64_t> processed_items_{0};
    std::atomic<std::uint64_t> failed_items_{0};
    std::atomic<std::uint64_t> processed_bytes_{0};

    const bool enabled_;
    std::chrono::steady_clock::time_point start_time_;
    std::unique_ptr<std::jthread> render_thread_;
};

} // namespace objcp::infra
