#include "fs.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#ifdef __linux__
#include <liburing.h>
#endif

namespace objcp::adapters::fs {

namespace {

// Closes the descriptor on scope exit.
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { if (fd_ != -1) ::close(fd_); }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] auto get() const -> int { return fd_; }
    [[nodiscard]] auto ok() const -> bool { return fd_ != -1; }

private:
    int fd_;
};

auto open_error(const std::filesystem::path& path, std::string_view what) -> infra::Error {
    const auto code = errno == ENOENT ? infra::ErrorCode::NotFound
                    : (errno == EACCES || errno == EPERM) ? infra::ErrorCode::PermissionDenied
                    : infra::ErrorCode::TransferFailed;
    return infra::make_error(code, fmt::format("Cannot open {} {}: {}", what, path.string(), std::strerror(errno)));
}

auto temp_sibling(const std::filesystem::path& dst) -> std::filesystem::path {
    static std::atomic<std::uint64_t> counter{0};
    auto name = fmt::format(".{}.objcp-tmp.{}.{}", dst.filename().string(), ::getpid(), counter.fetch_add(1));
    return dst.parent_path() / name;
}

} // namespace

auto select_strategy(std::uintmax_t file_size) -> CopyStrategy {
    if (file_size < 1'000'000) return CopyStrategy::Buffered;      // < 1 MB
    if (file_size < 100'000'000) return CopyStrategy::MMap;        // < 100 MB
    return CopyStrategy::Uring;                                    // >= 100 MB
}

// =============== Buffered I/O ===============
auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> std::expected<std::uint64_t, infra::Error> {
    std::ifstream ifs(src, std::ios::binary);
    if (!ifs) {
        return std::unexpected(open_error(src, "source"));
    }
    std::ofstream ofs(dst, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        return std::unexpected(open_error(dst, "destination"));
    }

    constexpr size_t buffer_size = 64 * 1024;
    std::vector<char> buffer(buffer_size);
    std::uint64_t total = 0;
    while (ifs.read(buffer.data(), buffer_size) || ifs.gcount() > 0) {
        ofs.write(buffer.data(), ifs.gcount());
        total += static_cast<std::uint64_t>(ifs.gcount());
    }
    if (ifs.bad() || !ofs.flush()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::TransferFailed,
            fmt::format("I/O error copying {} to {}", src.string(), dst.string())));
    }
    return total;
}

// =============== Memory-mapped I/O ===============
auto copy_file_mmap(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> std::expected<std::uint64_t, infra::Error> {
    FileDescriptor src_fd(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!src_fd.ok()) {
        return std::unexpected(open_error(src, "source"));
    }

    struct stat sb;
    if (::fstat(src_fd.get(), &sb) == -1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::TransferFailed, "fstat failed"));
    }
    if (sb.st_size == 0) {
        return copy_file_buffered(src, dst);
    }
    const auto size = static_cast<std::size_t>(sb.st_size);

    void* src_map = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, src_fd.get(), 0);
    if (src_map == MAP_FAILED) {
        return copy_file_buffered(src, dst);
    }

    FileDescriptor dst_fd(::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!dst_fd.ok()) {
        ::munmap(src_map, size);
        return std::unexpected(open_error(dst, "destination"));
    }

    const auto* data = static_cast<const char*>(src_map);
    std::size_t written = 0;
    while (written < size) {
        const auto n = ::write(dst_fd.get(), data + written, size - written);
        if (n == -1) {
            if (errno == EINTR) continue;
            break;
        }
        written += static_cast<std::size_t>(n);
    }
    ::munmap(src_map, size);

    if (written != size) {
        return std::unexpected(infra::make_error(infra::ErrorCode::TransferFailed,
            fmt::format("Incomplete write in mmap copy to {}", dst.string())));
    }
    return written;
}

// =============== io_uring ===============
auto copy_file_uring(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> std::expected<std::uint64_t, infra::Error> {
#ifdef __linux__
    constexpr unsigned RING_SIZE = 8;
    constexpr size_t CHUNK_SIZE = 4 * 1024 * 1024; // 4 MB

    io_uring ring;
    if (io_uring_queue_init(RING_SIZE, &ring, 0) < 0) {
        spdlog::debug("io_uring unavailable, falling back to buffered copy");
        return copy_file_buffered(src, dst);
    }

    FileDescriptor src_fd(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    FileDescriptor dst_fd(::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!src_fd.ok() || !dst_fd.ok()) {
        io_uring_queue_exit(&ring);
        return std::unexpected(open_error(src_fd.ok() ? dst : src, src_fd.ok() ? "destination" : "source"));
    }

    // One request in flight at a time: read a chunk, then write it out.
    auto submit_and_wait = [&ring](auto&& prep) -> int {
        io_uring_sqe* sqe = io_uring_get_sqe(&ring);
        if (!sqe) return -EBUSY;
        prep(sqe);
        if (io_uring_submit(&ring) < 0) return -EIO;
        io_uring_cqe* cqe = nullptr;
        if (io_uring_wait_cqe(&ring, &cqe) < 0) return -EIO;
        const int res = cqe->res;
        io_uring_cqe_seen(&ring, cqe);
        return res;
    };

    std::vector<char> buffer(CHUNK_SIZE);
    std::uint64_t offset = 0;
    std::expected<std::uint64_t, infra::Error> result = 0;

    while (true) {
        const int got = submit_and_wait([&](io_uring_sqe* sqe) {
            io_uring_prep_read(sqe, src_fd.get(), buffer.data(), CHUNK_SIZE, offset);
        });
        if (got < 0) {
            result = std::unexpected(infra::make_error(infra::ErrorCode::TransferFailed,
                fmt::format("io_uring read of {} failed: {}", src.string(), std::strerror(-got))));
            break;
        }
        if (got == 0) {
            result = offset;
            break;
        }

        std::size_t done = 0;
        while (done < static_cast<std::size_t>(got)) {
            const int put = submit_and_wait([&](io_uring_sqe* sqe) {
                io_uring_prep_write(sqe, dst_fd.get(), buffer.data() + done,
                                    static_cast<unsigned>(got - done), offset + done);
            });
            if (put <= 0) {
                result = std::unexpected(infra::make_error(infra::ErrorCode::TransferFailed,
                    fmt::format("io_uring write of {} failed: {}", dst.string(), std::strerror(put < 0 ? -put : EIO))));
                break;
            }
            done += static_cast<std::size_t>(put);
        }
        if (!result) break;
        offset += static_cast<std::uint64_t>(got);
    }

    io_uring_queue_exit(&ring);
    return result;
#else
    return copy_file_buffered(src, dst);
#endif
}

// =============== Unified copy_file ===============
auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    CopyStrategy strategy
) -> std::expected<std::uint64_t, infra::Error> {
    switch (strategy) {
        case CopyStrategy::MMap:
            return copy_file_mmap(src, dst);
        case CopyStrategy::Uring:
            return copy_file_uring(src, dst);
        case CopyStrategy::Buffered:
        default:
            return copy_file_buffered(src, dst);
    }
}

auto copy_file_atomic(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    bool replace_existing
) -> std::expected<std::uint64_t, infra::Error> {
    std::error_code ec;
    const auto size = std::filesystem::file_size(src, ec);
    if (ec) {
        return std::unexpected(infra::make_error(
            ec == std::errc::no_such_file_or_directory ? infra::ErrorCode::NotFound : infra::ErrorCode::TransferFailed,
            fmt::format("Cannot stat {}: {}", src.string(), ec.message())));
    }

    const auto tmp = temp_sibling(dst);
    auto copied = copy_file(src, tmp, select_strategy(size));
    if (!copied) {
        std::filesystem::remove(tmp, ec);
        return copied;
    }

    if (!replace_existing) {
        // link() refuses an existing target, unlike rename().
        const int rc = ::link(tmp.c_str(), dst.c_str());
        const int link_errno = errno;
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        if (rc == -1) {
            return std::unexpected(infra::make_error(
                link_errno == EEXIST ? infra::ErrorCode::ItemExists : infra::ErrorCode::TransferFailed,
                fmt::format("Cannot move {} into place: {}", dst.string(), std::strerror(link_errno))));
        }
        return copied;
    }

    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return std::unexpected(infra::make_error(infra::ErrorCode::TransferFailed,
            fmt::format("Cannot move {} into place: {}", dst.string(), ec.message())));
    }
    return copied;
}

} // namespace objcp::adapters::fs
