#pragma once

#include <filesystem>
#include <expected>
#include <cstddef>
#include <cstdint>
#include <string>
#include "infra/error_handler/error.hpp"

#include <sys/stat.h>
#include <sys/types.h>

// BSD-семейство и macOS: у struct stat есть st_flags
#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__NetBSD__) \
    || defined(__OpenBSD__) || defined(__DragonFly__)
    #define FCOPY_HAS_ST_FLAGS 1
#else
    #define FCOPY_HAS_ST_FLAGS 0
#endif

namespace fcopy::adapters::fs {

// Размер чанка при потоковом копировании; ограничивает пиковую память
inline constexpr std::size_t COPY_CHUNK_SIZE = 16 * 1024;

using FileStatus = struct ::stat;

/// Владеющая обёртка над файловым дескриптором.
/// Дескриптор закрывается в деструкторе на любом пути выхода.
class FileHandle {
public:
    FileHandle() = default;
    explicit FileHandle(int fd) : fd_(fd) {}
    ~FileHandle();

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;

    [[nodiscard]] auto get() const -> int { return fd_; }
    [[nodiscard]] auto valid() const -> bool { return fd_ >= 0; }

private:
    void reset_() noexcept;

    int fd_ = -1;
};

[[nodiscard]] auto open_for_read(const std::filesystem::path& path)
    -> infra::Result<FileHandle>;

// Создаёт или обрезает файл назначения
[[nodiscard]] auto open_for_write(const std::filesystem::path& path)
    -> infra::Result<FileHandle>;

/// stat() при follow_symlinks, иначе lstat().
[[nodiscard]] auto stat_path(const std::filesystem::path& path, bool follow_symlinks = true)
    -> infra::Result<FileStatus>;

[[nodiscard]] auto is_symlink(const std::filesystem::path& path) -> bool;
[[nodiscard]] auto is_directory(const std::filesystem::path& path) -> bool;

[[nodiscard]] auto read_link(const std::filesystem::path& path)
    -> infra::Result<std::string>;

[[nodiscard]] auto create_symlink(const std::string& target,
                                  const std::filesystem::path& link)
    -> infra::VoidResult;

/// Копирует поток src -> dst чанками по chunk_size до EOF.
/// Возвращает количество скопированных байт.
[[nodiscard]] auto copy_stream(const FileHandle& src,
                               const FileHandle& dst,
                               std::size_t chunk_size = COPY_CHUNK_SIZE)
    -> infra::Result<std::uint64_t>;

// Время доступа и модификации с точностью до наносекунд
[[nodiscard]] auto set_times(const std::filesystem::path& path,
                             const FileStatus& st,
                             bool follow_symlinks)
    -> infra::VoidResult;

[[nodiscard]] auto set_mode(const std::filesystem::path& path,
                            mode_t mode,
                            bool follow_symlinks)
    -> infra::VoidResult;

#if FCOPY_HAS_ST_FLAGS
[[nodiscard]] auto set_flags(const std::filesystem::path& path,
                             unsigned long flags,
                             bool follow_symlinks)
    -> infra::VoidResult;
#endif

} // namespace fcopy::adapters::fs
