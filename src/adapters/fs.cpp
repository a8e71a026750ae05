#include "fs.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>
#include <system_error>
#include <fmt/core.h>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace rcopy::adapters::fs {

namespace {

auto errno_error(std::string_view what, const std::filesystem::path& path, int err) -> infra::Error {
    return infra::make_error(infra::code_from_errno(err),
                             fmt::format("{} {}: {}", what, path.string(), std::strerror(err)));
}

// write() может записать меньше запрошенного
auto write_all(int fd, const char* data, std::size_t size) -> int {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return 0;
}

auto write_fd(const std::filesystem::path& path, int flags, std::string_view data, bool sync)
    -> infra::VoidResult
{
    int fd = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
    if (fd == -1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::LedgerIOFailed,
            fmt::format("Cannot open {}: {}", path.string(), std::strerror(errno))));
    }

    if (int err = write_all(fd, data.data(), data.size()); err != 0) {
        ::close(fd);
        return std::unexpected(infra::make_error(infra::ErrorCode::LedgerIOFailed,
            fmt::format("Write to {} failed: {}", path.string(), std::strerror(err))));
    }

    if (sync && ::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        return std::unexpected(infra::make_error(infra::ErrorCode::LedgerIOFailed,
            fmt::format("fsync of {} failed: {}", path.string(), std::strerror(err))));
    }

    if (::close(fd) != 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::LedgerIOFailed,
            fmt::format("Close of {} failed: {}", path.string(), std::strerror(errno))));
    }
    return {};
}

} // namespace

auto select_strategy(std::uintmax_t file_size) -> CopyStrategy {
    if (file_size < 1'000'000) return CopyStrategy::Buffered;      // < 1 MB
    return CopyStrategy::MMap;
}

// =============== Buffered I/O ===============
auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult {
    errno = 0;
    std::ifstream ifs(src, std::ios::binary);
    if (!ifs) {
        return std::unexpected(errno_error("Cannot open source", src, errno ? errno : ENOENT));
    }
    errno = 0;
    std::ofstream ofs(dst, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        return std::unexpected(errno_error("Cannot create destination", dst, errno ? errno : EACCES));
    }

    constexpr size_t buffer_size = 64 * 1024;
    std::vector<char> buffer(buffer_size);
    while (ifs.read(buffer.data(), buffer_size) || ifs.gcount() > 0) {
        if (!ofs.write(buffer.data(), ifs.gcount())) {
            return std::unexpected(infra::make_error(infra::ErrorCode::IOFailure,
                fmt::format("Write error on {}", dst.string())));
        }
    }
    if (ifs.bad()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IOFailure,
            fmt::format("Read error on {}", src.string())));
    }

    ofs.close();
    if (!ofs) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IOFailure,
            fmt::format("Cannot finish writing {}", dst.string())));
    }
    return {};
}

// =============== Memory-mapped I/O ===============
auto copy_file_mmap(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult {
    int src_fd = ::open(src.c_str(), O_RDONLY | O_CLOEXEC);
    if (src_fd == -1) {
        return std::unexpected(errno_error("Cannot open source", src, errno));
    }

    struct stat sb;
    if (::fstat(src_fd, &sb) == -1) {
        int err = errno;
        ::close(src_fd);
        return std::unexpected(errno_error("fstat failed for", src, err));
    }

    // mmap не умеет отображать пустой файл
    if (sb.st_size == 0) {
        ::close(src_fd);
        return copy_file_buffered(src, dst);
    }

    const auto size = static_cast<std::size_t>(sb.st_size);
    void* src_map = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, src_fd, 0);
    ::close(src_fd);
    if (src_map == MAP_FAILED) {
        return std::unexpected(errno_error("mmap failed for", src, errno));
    }

    int dst_fd = ::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (dst_fd == -1) {
        int err = errno;
        ::munmap(src_map, size);
        return std::unexpected(errno_error("Cannot create destination", dst, err));
    }

    int err = write_all(dst_fd, static_cast<const char*>(src_map), size);
    ::munmap(src_map, size);
    if (::close(dst_fd) != 0 && err == 0) {
        err = errno;
    }

    if (err != 0) {
        return std::unexpected(errno_error("Write failed for", dst, err));
    }
    return {};
}

// =============== Unified copy_file ===============
auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    CopyStrategy strategy
) -> infra::VoidResult {
    switch (strategy) {
        case CopyStrategy::MMap:
            return copy_file_mmap(src, dst);
        case CopyStrategy::Buffered:
        default:
            return copy_file_buffered(src, dst);
    }
}

auto copy_file_auto(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult {
    auto size = adapters::fs::file_size(src);
    if (!size) {
        return std::unexpected(std::move(size.error()));
    }
    return copy_file(src, dst, select_strategy(*size));
}

auto file_size(const std::filesystem::path& path) -> infra::Result<std::uintmax_t> {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(infra::make_error_from(ec, fmt::format("Cannot read size of {}", path.string())));
    }
    return size;
}

auto append_durable(
    const std::filesystem::path& path,
    std::string_view data,
    bool sync
) -> infra::VoidResult {
    return write_fd(path, O_WRONLY | O_CREAT | O_APPEND, data, sync);
}

auto overwrite_durable(
    const std::filesystem::path& path,
    std::string_view data
) -> infra::VoidResult {
    return write_fd(path, O_WRONLY | O_CREAT | O_TRUNC, data, true);
}

} // namespace rcopy::adapters::fs
