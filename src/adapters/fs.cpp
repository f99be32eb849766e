#include "fs.hpp"

#include <cerrno>
#include <vector>
#include <fmt/core.h>

#include <fcntl.h>
#include <unistd.h>

namespace fcopy::adapters::fs {

// =============== FileHandle ===============
FileHandle::~FileHandle() {
    reset_();
}

FileHandle::FileHandle(FileHandle&& other) noexcept
    : fd_(other.fd_)
{
    other.fd_ = -1;
}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        reset_();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void FileHandle::reset_() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// =============== open ===============
auto open_for_read(const std::filesystem::path& path)
    -> infra::Result<FileHandle>
{
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        return std::unexpected(infra::make_os_error(errno,
            fmt::format("Cannot open source {}", path.string())));
    }
    return FileHandle{fd};
}

auto open_for_write(const std::filesystem::path& path)
    -> infra::Result<FileHandle>
{
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666);
    if (fd == -1) {
        return std::unexpected(infra::make_os_error(errno,
            fmt::format("Cannot open destination {}", path.string())));
    }
    return FileHandle{fd};
}

// =============== stat / symlinks ===============
auto stat_path(const std::filesystem::path& path, bool follow_symlinks)
    -> infra::Result<FileStatus>
{
    FileStatus st{};
    int rc = follow_symlinks ? ::stat(path.c_str(), &st)
                             : ::lstat(path.c_str(), &st);
    if (rc == -1) {
        return std::unexpected(infra::make_os_error(errno,
            fmt::format("{} failed for {}", follow_symlinks ? "stat" : "lstat", path.string())));
    }
    return st;
}

auto is_symlink(const std::filesystem::path& path) -> bool {
    auto st = stat_path(path, false);
    return st && S_ISLNK(st->st_mode);
}

auto is_directory(const std::filesystem::path& path) -> bool {
    auto st = stat_path(path, true);
    return st && S_ISDIR(st->st_mode);
}

auto read_link(const std::filesystem::path& path)
    -> infra::Result<std::string>
{
    std::vector<char> buffer(256);
    for (;;) {
        ssize_t len = ::readlink(path.c_str(), buffer.data(), buffer.size());
        if (len == -1) {
            return std::unexpected(infra::make_os_error(errno,
                fmt::format("readlink failed for {}", path.string())));
        }
        // Цель могла не поместиться: увеличиваем буфер и повторяем
        if (static_cast<std::size_t>(len) < buffer.size()) {
            return std::string(buffer.data(), static_cast<std::size_t>(len));
        }
        buffer.resize(buffer.size() * 2);
    }
}

auto create_symlink(const std::string& target, const std::filesystem::path& link)
    -> infra::VoidResult
{
    if (::symlink(target.c_str(), link.c_str()) == -1) {
        return std::unexpected(infra::make_os_error(errno,
            fmt::format("Cannot create symlink {} -> {}", link.string(), target)));
    }
    return {};
}

// =============== Buffered I/O ===============
auto copy_stream(const FileHandle& src, const FileHandle& dst, std::size_t chunk_size)
    -> infra::Result<std::uint64_t>
{
    std::vector<char> buffer(chunk_size);
    std::uint64_t total = 0;

    for (;;) {
        ssize_t bytes_read = ::read(src.get(), buffer.data(), buffer.size());
        if (bytes_read == -1) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_os_error(errno, "Read failed"));
        }
        if (bytes_read == 0) {
            break; // EOF
        }

        std::size_t offset = 0;
        const auto to_write = static_cast<std::size_t>(bytes_read);
        while (offset < to_write) {
            ssize_t written = ::write(dst.get(), buffer.data() + offset, to_write - offset);
            if (written == -1) {
                if (errno == EINTR) continue;
                return std::unexpected(infra::make_os_error(errno, "Write failed"));
            }
            offset += static_cast<std::size_t>(written);
        }
        total += to_write;
    }

    return total;
}

// =============== Метаданные ===============
auto set_times(const std::filesystem::path& path, const FileStatus& st, bool follow_symlinks)
    -> infra::VoidResult
{
    struct timespec times[2];
#ifdef __APPLE__
    times[0] = st.st_atimespec;
    times[1] = st.st_mtimespec;
#else
    times[0] = st.st_atim;
    times[1] = st.st_mtim;
#endif

    int flags = follow_symlinks ? 0 : AT_SYMLINK_NOFOLLOW;
    if (::utimensat(AT_FDCWD, path.c_str(), times, flags) == -1) {
        return std::unexpected(infra::make_os_error(errno,
            fmt::format("Cannot set timestamps on {}", path.string())));
    }
    return {};
}

auto set_mode(const std::filesystem::path& path, mode_t mode, bool follow_symlinks)
    -> infra::VoidResult
{
    int flags = follow_symlinks ? 0 : AT_SYMLINK_NOFOLLOW;
    if (::fchmodat(AT_FDCWD, path.c_str(), mode, flags) == -1) {
        return std::unexpected(infra::make_os_error(errno,
            fmt::format("Cannot change mode of {}", path.string())));
    }
    return {};
}

#if FCOPY_HAS_ST_FLAGS
auto set_flags(const std::filesystem::path& path, unsigned long flags, bool follow_symlinks)
    -> infra::VoidResult
{
    int rc = follow_symlinks ? ::chflags(path.c_str(), flags)
                             : ::lchflags(path.c_str(), flags);
    if (rc == -1) {
        return std::unexpected(infra::make_os_error(errno,
            fmt::format("Cannot set file flags on {}", path.string())));
    }
    return {};
}
#endif

} // namespace fcopy::adapters::fs
