#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include <sys/types.h>
#include "infra/error_handler/error.hpp"

namespace objcp::infra {

/// A flag in anonymous shared memory, visible to every process forked after
/// it was created.
class SharedFlag {
public:
    [[nodiscard]] static auto create() -> Result<SharedFlag>;

    SharedFlag(SharedFlag&& other) noexcept;
    SharedFlag& operator=(SharedFlag&& other) noexcept;
    ~SharedFlag();

    SharedFlag(const SharedFlag&) = delete;
    SharedFlag& operator=(const SharedFlag&) = delete;

    void set();
    [[nodiscard]] auto is_set() const -> bool;

private:
    explicit SharedFlag(std::atomic<bool>* flag) : flag_(flag) {}
    void release();

    std::atomic<bool>* flag_ = nullptr;
};

// Length-prefixed frames over a pipe.
[[nodiscard]] auto write_frame(int fd, std::string_view payload) -> bool;
[[nodiscard]] auto read_frame(int fd) -> std::optional<std::string>;

/// Forks worker processes that each run a thread pool. The parent hands
/// out opaque jobs round-robin over per-worker pipes; every finished job
/// produces one result frame, which the parent delivers to a single
/// aggregator thread.
class ProcessPool {
public:
    // Runs inside a worker process, possibly on several threads at once.
    using JobHandler = std::function<std::string(const std::string& job)>;
    // Runs on the parent's aggregator thread only. Returning false stops
    // the workers from starting further jobs.
    using ResultHandler = std::function<bool(const std::string& result)>;

    ProcessPool(std::size_t processes, std::size_t threads_per_process,
                JobHandler job_handler, ResultHandler result_handler);
    ~ProcessPool();

    ProcessPool(const ProcessPool&) = delete;
    ProcessPool& operator=(const ProcessPool&) = delete;

    [[nodiscard]] auto start() -> VoidResult;
    [[nodiscard]] auto dispatch(std::string_view job) -> VoidResult;

    void stop_new_work();
    [[nodiscard]] auto stopped() const -> bool { return stop_requested_.load(); }

    /// Closes the job pipes, waits for every result and reaps the workers.
    [[nodiscard]] auto finish() -> VoidResult;

private:
    struct Worker {
        pid_t pid = -1;
        int job_fd = -1;      // parent writes
        int result_fd = -1;   // parent reads
    };

    [[noreturn]] void worker_main(int job_fd, int result_fd);
    void aggregate();
    void close_job_pipes();

    std::size_t processes_;
    std::size_t threads_per_process_;
    JobHandler job_handler_;
    ResultHandler result_handler_;

    std::optional<SharedFlag> stop_flag_;   // created by start()
    std::atomic<bool> stop_requested_{false};
    std::vector<Worker> workers_;
    std::size_t next_worker_ = 0;
    std::jthread aggregator_;
    bool started_ = false;
    bool finished_ = false;
};

} // namespace objcp::infra
