#include "fs.hpp"

#include <cerrno>
#include <system_error>
#include <utility>
#include <vector>
#include <fmt/core.h>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace copysort::adapters::fs {

namespace {

// Владеет файловым дескриптором
class UniqueFd {
public:
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { if (fd_ != -1) ::close(fd_); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd& operator=(UniqueFd&&) = delete;

    [[nodiscard]] auto get() const -> int { return fd_; }
    [[nodiscard]] auto valid() const -> bool { return fd_ != -1; }

    // close() отдельно, чтобы не потерять ошибку отложенной записи
    [[nodiscard]] auto close() -> int {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

auto errno_code() -> std::error_code {
    return {errno, std::generic_category()};
}

auto open_error_code(int err) -> infra::ErrorCode {
    switch (err) {
        case ENOENT: return infra::ErrorCode::FileNotFound;
        case EACCES:
        case EPERM:  return infra::ErrorCode::PermissionDenied;
        default:     return infra::ErrorCode::Unknown;
    }
}

auto open_source(const std::filesystem::path& src) -> infra::Result<UniqueFd> {
    UniqueFd fd{::open(src.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!fd.valid()) {
        int err = errno;
        return std::unexpected(infra::make_system_error(open_error_code(err),
            fmt::format("Cannot open source {}", src.string()),
            std::error_code{err, std::generic_category()}));
    }
    return fd;
}

auto create_destination(const std::filesystem::path& dst) -> infra::Result<UniqueFd> {
    UniqueFd fd{::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)};
    if (!fd.valid()) {
        int err = errno;
        return std::unexpected(infra::make_system_error(open_error_code(err),
            fmt::format("Cannot create destination {}", dst.string()),
            std::error_code{err, std::generic_category()}));
    }
    return fd;
}

// write(2) до полного опустошения буфера
auto write_all(int fd, const char* data, std::size_t size) -> bool {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return true;
}

auto finish_destination(UniqueFd& out, const std::filesystem::path& dst)
    -> infra::VoidResult
{
    if (out.close() != 0) {
        return std::unexpected(infra::make_system_error(infra::ErrorCode::WriteFailed,
            fmt::format("Close failed for {}", dst.string()), errno_code()));
    }
    return {};
}

} // namespace

auto select_strategy(std::uint64_t file_size) -> CopyStrategy {
    if (file_size < 1'000'000) return CopyStrategy::Buffered;      // < 1 MB
    if (file_size < 100'000'000) return CopyStrategy::MMap;        // < 100 MB
    return CopyStrategy::Buffered;                                 // большие файлы потоком
}

auto stat_file(const std::filesystem::path& path) -> infra::Result<FileInfo> {
    struct stat sb;
    if (::stat(path.c_str(), &sb) == -1) {
        int err = errno;
        return std::unexpected(infra::make_system_error(open_error_code(err),
            fmt::format("stat failed for {}", path.string()),
            std::error_code{err, std::generic_category()}));
    }
    return FileInfo{
        .size = static_cast<std::uint64_t>(sb.st_size),
        .mtime = sb.st_mtim
    };
}

auto ensure_parent_directories(const std::filesystem::path& dst) -> infra::VoidResult {
    const auto parent = dst.parent_path();
    if (parent.empty()) return {};

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return std::unexpected(infra::make_system_error(infra::ErrorCode::PermissionDenied,
            fmt::format("Cannot create directory {}", parent.string()), ec));
    }
    return {};
}

// =============== Buffered I/O ===============
auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t buffer_size
) -> infra::Result<std::uint64_t> {
    auto in = open_source(src);
    if (!in) return std::unexpected(std::move(in.error()));
    auto out = create_destination(dst);
    if (!out) return std::unexpected(std::move(out.error()));

    if (buffer_size == 0) buffer_size = kDefaultBufferSize;
    std::vector<char> buffer(buffer_size);
    std::uint64_t copied = 0;

    for (;;) {
        ssize_t n = ::read(in->get(), buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_system_error(infra::ErrorCode::ReadFailed,
                fmt::format("Read failed for {}", src.string()), errno_code()));
        }
        if (n == 0) break;
        if (!write_all(out->get(), buffer.data(), static_cast<std::size_t>(n))) {
            return std::unexpected(infra::make_system_error(infra::ErrorCode::WriteFailed,
                fmt::format("Write failed for {}", dst.string()), errno_code()));
        }
        copied += static_cast<std::uint64_t>(n);
    }

    auto closed = finish_destination(*out, dst);
    if (!closed) return std::unexpected(std::move(closed.error()));
    return copied;
}

// =============== Memory-mapped I/O ===============
auto copy_file_mmap(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::Result<std::uint64_t> {
    auto in = open_source(src);
    if (!in) return std::unexpected(std::move(in.error()));

    struct stat sb;
    if (::fstat(in->get(), &sb) == -1) {
        return std::unexpected(infra::make_system_error(infra::ErrorCode::ReadFailed,
            fmt::format("fstat failed for {}", src.string()), errno_code()));
    }
    const auto size = static_cast<std::size_t>(sb.st_size);

    // mmap нулевой длины невозможен
    if (size == 0) {
        return copy_file_buffered(src, dst);
    }

    void* src_map = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, in->get(), 0);
    if (src_map == MAP_FAILED) {
        return copy_file_buffered(src, dst);
    }
    ::madvise(src_map, size, MADV_SEQUENTIAL);

    auto out = create_destination(dst);
    if (!out) {
        ::munmap(src_map, size);
        return std::unexpected(std::move(out.error()));
    }

    bool written = write_all(out->get(), static_cast<const char*>(src_map), size);
    int write_errno = errno;
    ::munmap(src_map, size);

    if (!written) {
        return std::unexpected(infra::make_system_error(infra::ErrorCode::WriteFailed,
            fmt::format("Incomplete write in mmap copy to {}", dst.string()),
            std::error_code{write_errno, std::generic_category()}));
    }

    auto closed = finish_destination(*out, dst);
    if (!closed) return std::unexpected(std::move(closed.error()));
    return static_cast<std::uint64_t>(size);
}

// =============== Unified copy_file ===============
auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    CopyStrategy strategy,
    std::size_t buffer_size
) -> infra::Result<std::uint64_t> {
    switch (strategy) {
        case CopyStrategy::MMap:
            return copy_file_mmap(src, dst);
        case CopyStrategy::Buffered:
        default:
            return copy_file_buffered(src, dst, buffer_size);
    }
}

} // namespace copysort::adapters::fs
