#include "process_pool.hpp"

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <new>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <poll.h>
#include <sys/mman.h>
#include <sys/wait.h>
#include <unistd.h>

#include "infra/thread_pool/thread_pool.hpp"

namespace objcp::infra {

namespace {

constexpr std::uint32_t kMaxFrame = 16 * 1024 * 1024;

auto write_all(int fd, const char* data, std::size_t size) -> bool {
    while (size > 0) {
        const auto n = ::write(fd, data, size);
        if (n == -1) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return true;
}

// false on EOF before `size` bytes or on error
auto read_all(int fd, char* data, std::size_t size) -> bool {
    while (size > 0) {
        const auto n = ::read(fd, data, size);
        if (n == -1) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false;
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

auto SharedFlag::create() -> Result<SharedFlag> {
    void* mem = ::mmap(nullptr, sizeof(std::atomic<bool>), PROT_READ | PROT_WRITE,
                       MAP_SHARED | MAP_ANONYMOUS, -1, 0);
    if (mem == MAP_FAILED) {
        return std::unexpected(make_error(ErrorCode::Unknown,
            fmt::format("mmap for shared stop flag failed: {}", std::strerror(errno))));
    }
    return SharedFlag(new (mem) std::atomic<bool>(false));
}

SharedFlag::SharedFlag(SharedFlag&& other) noexcept
    : flag_(std::exchange(other.flag_, nullptr))
{}

SharedFlag& SharedFlag::operator=(SharedFlag&& other) noexcept {
    if (this != &other) {
        release();
        flag_ = std::exchange(other.flag_, nullptr);
    }
    return *this;
}

SharedFlag::~SharedFlag() {
    release();
}

void SharedFlag::release() {
    if (flag_) {
        flag_->~atomic();
        ::munmap(flag_, sizeof(std::atomic<bool>));
        flag_ = nullptr;
    }
}

void SharedFlag::set() {
    flag_->store(true, std::memory_order_release);
}

bool SharedFlag::is_set() const {
    return flag_->load(std::memory_order_acquire);
}

bool write_frame(int fd, std::string_view payload) {
    if (payload.size() > kMaxFrame) {
        return false;
    }
    const auto size = static_cast<std::uint32_t>(payload.size());
    char header[sizeof(size)];
    std::memcpy(header, &size, sizeof(size));

    // One buffer, one write loop: frames from different threads never interleave
    // as long as the caller serializes calls per descriptor.
    std::string buffer(header, sizeof(header));
    buffer.append(payload);
    return write_all(fd, buffer.data(), buffer.size());
}

auto read_frame(int fd) -> std::optional<std::string> {
    std::uint32_t size = 0;
    char header[sizeof(size)];
    if (!read_all(fd, header, sizeof(header))) {
        return std::nullopt;
    }
    std::memcpy(&size, header, sizeof(size));
    if (size > kMaxFrame) {
        return std::nullopt;
    }
    std::string payload(size, '\0');
    if (size > 0 && !read_all(fd, payload.data(), size)) {
        return std::nullopt;
    }
    return payload;
}

ProcessPool::ProcessPool(std::size_t processes, std::size_t threads_per_process,
                         JobHandler job_handler, ResultHandler result_handler)
    : processes_(processes == 0 ? 1 : processes)
    , threads_per_process_(threads_per_process == 0 ? 1 : threads_per_process)
    , job_handler_(std::move(job_handler))
    , result_handler_(std::move(result_handler))
{}

ProcessPool::~ProcessPool() {
    if (started_ && !finished_) {
        stop_new_work();
        if (auto res = finish(); !res) {
            spdlog::warn("Process pool shutdown: {}", res.error().message);
        }
    }
}

auto ProcessPool::start() -> VoidResult {
    if (started_) {
        return {};
    }
    // Workers only see the flag if it exists before they are forked.
    auto flag = SharedFlag::create();
    if (!flag) {
        return std::unexpected(std::move(flag.error()));
    }
    stop_flag_.emplace(std::move(*flag));
    if (stop_requested_.load()) {
        stop_flag_->set();
    }

    // A worker that died must not kill the parent on the next dispatch.
    std::signal(SIGPIPE, SIG_IGN);

    for (std::size_t i = 0; i < processes_; ++i) {
        int job_pipe[2];
        int result_pipe[2];
        if (::pipe(job_pipe) == -1) {
            return std::unexpected(make_error(ErrorCode::Unknown,
                fmt::format("pipe failed: {}", std::strerror(errno))));
        }
        if (::pipe(result_pipe) == -1) {
            ::close(job_pipe[0]);
            ::close(job_pipe[1]);
            return std::unexpected(make_error(ErrorCode::Unknown,
                fmt::format("pipe failed: {}", std::strerror(errno))));
        }

        const pid_t pid = ::fork();
        if (pid == -1) {
            for (int fd : {job_pipe[0], job_pipe[1], result_pipe[0], result_pipe[1]}) ::close(fd);
            return std::unexpected(make_error(ErrorCode::Unknown,
                fmt::format("fork failed: {}", std::strerror(errno))));
        }

        if (pid == 0) {
            // Drop the parent's ends of every earlier worker, otherwise
            // those workers would never see EOF on their job pipe.
            for (const auto& other : workers_) {
                ::close(other.job_fd);
                ::close(other.result_fd);
            }
            ::close(job_pipe[1]);
            ::close(result_pipe[0]);
            worker_main(job_pipe[0], result_pipe[1]);
        }

        ::close(job_pipe[0]);
        ::close(result_pipe[1]);
        workers_.push_back(Worker{.pid = pid, .job_fd = job_pipe[1], .result_fd = result_pipe[0]});
        spdlog::debug("Started worker process {} (pid {})", i, pid);
    }

    started_ = true;
    aggregator_ = std::jthread([this] { aggregate(); });
    return {};
}

void ProcessPool::worker_main(int job_fd, int result_fd) {
    int exit_code = 0;
    try {
        std::mutex result_mutex;
        ThreadPool pool{threads_per_process_};
        const auto window = pool.size() * 2;

        while (auto job = read_frame(job_fd)) {
            if (stop_flag_->is_set()) {
                // Not started yet, so not reported either.
                continue;
            }
            pool.wait_for_capacity(window);
            pool.enqueue([this, &result_mutex, &exit_code, result_fd, job = std::move(*job)] {
                if (stop_flag_->is_set()) {
                    return;
                }
                auto result = job_handler_(job);
                std::lock_guard lock(result_mutex);
                if (!write_frame(result_fd, result)) {
                    exit_code = 2;
                }
            });
        }
        pool.wait();
    } catch (const std::exception& e) {
        spdlog::error("Worker process {} failed: {}", ::getpid(), e.what());
        exit_code = 1;
    }

    ::close(job_fd);
    ::close(result_fd);
    spdlog::default_logger()->flush();
    ::_exit(exit_code);
}

void ProcessPool::aggregate() {
    std::vector<pollfd> fds;
    fds.reserve(workers_.size());
    for (const auto& worker : workers_) {
        fds.push_back(pollfd{.fd = worker.result_fd, .events = POLLIN, .revents = 0});
    }

    std::size_t open_count = fds.size();
    while (open_count > 0) {
        const int ready = ::poll(fds.data(), fds.size(), -1);
        if (ready == -1) {
            if (errno == EINTR) continue;
            spdlog::error("poll failed: {}", std::strerror(errno));
            break;
        }
        for (auto& pfd : fds) {
            if (pfd.fd < 0 || pfd.revents == 0) continue;

            auto frame = read_frame(pfd.fd);
            if (!frame) {
                pfd.fd = -1;   // worker closed its result pipe
                --open_count;
                continue;
            }
            if (!result_handler_(*frame)) {
                stop_new_work();
            }
        }
    }
}

auto ProcessPool::dispatch(std::string_view job) -> VoidResult {
    if (!started_ || workers_.empty()) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Process pool is not running"));
    }
    // Skip workers whose pipe broke; give up once all of them did.
    for (std::size_t attempt = 0; attempt < workers_.size(); ++attempt) {
        auto& worker = workers_[next_worker_];
        next_worker_ = (next_worker_ + 1) % workers_.size();
        if (worker.job_fd < 0) continue;
        if (write_frame(worker.job_fd, job)) {
            return {};
        }
        spdlog::warn("Worker {} stopped accepting jobs: {}", worker.pid, std::strerror(errno));
        ::close(worker.job_fd);
        worker.job_fd = -1;
    }
    return std::unexpected(make_error(ErrorCode::Unknown, "No worker process accepts jobs"));
}

void ProcessPool::stop_new_work() {
    stop_requested_.store(true);
    if (stop_flag_) {
        stop_flag_->set();
    }
}

void ProcessPool::close_job_pipes() {
    for (auto& worker : workers_) {
        if (worker.job_fd >= 0) {
            ::close(worker.job_fd);
            worker.job_fd = -1;
        }
    }
}

auto ProcessPool::finish() -> VoidResult {
    if (!started_ || finished_) {
        return {};
    }
    finished_ = true;
    close_job_pipes();

    if (aggregator_.joinable()) {
        aggregator_.join();
    }

    int failed = 0;
    for (auto& worker : workers_) {
        if (worker.result_fd >= 0) {
            ::close(worker.result_fd);
            worker.result_fd = -1;
        }
        int status = 0;
        while (::waitpid(worker.pid, &status, 0) == -1 && errno == EINTR) {}
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            spdlog::error("Worker process {} exited abnormally (status {})", worker.pid, status);
            ++failed;
        }
    }

    if (failed > 0) {
        return std::unexpected(make_error(ErrorCode::Unknown,
            fmt::format("{} worker process(es) exited abnormally", failed)));
    }
    return {};
}

} // namespace objcp::infra
