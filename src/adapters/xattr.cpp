#include "xattr.hpp"

#include <cerrno>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#if defined(__linux__) || defined(__APPLE__)
    #include <sys/types.h>
    #include <sys/xattr.h>
    #define FCOPY_HAS_XATTR_SYSCALLS 1
#else
    #define FCOPY_HAS_XATTR_SYSCALLS 0
#endif

namespace fcopy::adapters::xattr {

namespace {

#if FCOPY_HAS_XATTR_SYSCALLS

// Тонкие обёртки: на macOS follow/no-follow передаётся опцией, на Linux - отдельным вызовом
auto sys_list(const char* path, char* buf, std::size_t size, bool follow) -> ssize_t {
#ifdef __APPLE__
    return ::listxattr(path, buf, size, follow ? 0 : XATTR_NOFOLLOW);
#else
    return follow ? ::listxattr(path, buf, size) : ::llistxattr(path, buf, size);
#endif
}

auto sys_get(const char* path, const char* name, void* buf, std::size_t size, bool follow) -> ssize_t {
#ifdef __APPLE__
    return ::getxattr(path, name, buf, size, 0, follow ? 0 : XATTR_NOFOLLOW);
#else
    return follow ? ::getxattr(path, name, buf, size) : ::lgetxattr(path, name, buf, size);
#endif
}

auto sys_set(const char* path, const char* name, const void* value, std::size_t size, bool follow) -> int {
#ifdef __APPLE__
    return ::setxattr(path, name, value, size, 0, follow ? 0 : XATTR_NOFOLLOW);
#else
    return follow ? ::setxattr(path, name, value, size, 0)
                  : ::lsetxattr(path, name, value, size, 0);
#endif
}

#endif // FCOPY_HAS_XATTR_SYSCALLS

} // namespace

#if FCOPY_HAS_XATTR_SYSCALLS

auto PosixXattrOps::list_names(const std::filesystem::path& path, bool follow_symlinks) const
    -> infra::Result<std::vector<std::string>>
{
    std::string buffer;
    for (;;) {
        // Сначала узнаём размер, затем читаём; список мог вырасти между вызовами (ERANGE)
        ssize_t size = sys_list(path.c_str(), nullptr, 0, follow_symlinks);
        if (size == -1) {
            return std::unexpected(infra::make_os_error(errno,
                fmt::format("listxattr failed for {}", path.string())));
        }
        if (size == 0) {
            return std::vector<std::string>{};
        }

        buffer.resize(static_cast<std::size_t>(size));
        ssize_t got = sys_list(path.c_str(), buffer.data(), buffer.size(), follow_symlinks);
        if (got == -1) {
            if (errno == ERANGE) continue;
            return std::unexpected(infra::make_os_error(errno,
                fmt::format("listxattr failed for {}", path.string())));
        }
        buffer.resize(static_cast<std::size_t>(got));
        break;
    }

    // Имена разделены '\0'
    std::vector<std::string> names;
    std::size_t start = 0;
    while (start < buffer.size()) {
        auto end = buffer.find('\0', start);
        if (end == std::string::npos) end = buffer.size();
        if (end > start) {
            names.emplace_back(buffer, start, end - start);
        }
        start = end + 1;
    }
    return names;
}

auto PosixXattrOps::get_value(const std::filesystem::path& path,
                              const std::string& name,
                              bool follow_symlinks) const
    -> infra::Result<std::string>
{
    std::string value;
    for (;;) {
        ssize_t size = sys_get(path.c_str(), name.c_str(), nullptr, 0, follow_symlinks);
        if (size == -1) {
            return std::unexpected(infra::make_os_error(errno,
                fmt::format("getxattr {} failed for {}", name, path.string())));
        }
        value.resize(static_cast<std::size_t>(size));
        if (size == 0) {
            return value;
        }

        ssize_t got = sys_get(path.c_str(), name.c_str(), value.data(), value.size(), follow_symlinks);
        if (got == -1) {
            if (errno == ERANGE) continue;
            return std::unexpected(infra::make_os_error(errno,
                fmt::format("getxattr {} failed for {}", name, path.string())));
        }
        value.resize(static_cast<std::size_t>(got));
        return value;
    }
}

auto PosixXattrOps::set_value(const std::filesystem::path& path,
                              const std::string& name,
                              const std::string& value,
                              bool follow_symlinks) const
    -> infra::VoidResult
{
    if (sys_set(path.c_str(), name.c_str(), value.data(), value.size(), follow_symlinks) == -1) {
        return std::unexpected(infra::make_os_error(errno,
            fmt::format("setxattr {} failed for {}", name, path.string())));
    }
    return {};
}

auto host_supports_xattr() -> bool {
    // Любой ответ, кроме ENOSYS, означает, что вызовы есть
    if (sys_list(".", nullptr, 0, true) == -1 && errno == ENOSYS) {
        return false;
    }
    return true;
}

#else

auto PosixXattrOps::list_names(const std::filesystem::path&, bool) const
    -> infra::Result<std::vector<std::string>>
{
    return std::unexpected(infra::make_os_error(ENOTSUP, "listxattr is not available"));
}

auto PosixXattrOps::get_value(const std::filesystem::path&, const std::string&, bool) const
    -> infra::Result<std::string>
{
    return std::unexpected(infra::make_os_error(ENOTSUP, "getxattr is not available"));
}

auto PosixXattrOps::set_value(const std::filesystem::path&, const std::string&,
                              const std::string&, bool) const
    -> infra::VoidResult
{
    return std::unexpected(infra::make_os_error(ENOTSUP, "setxattr is not available"));
}

auto host_supports_xattr() -> bool {
    return false;
}

#endif // FCOPY_HAS_XATTR_SYSCALLS

auto select_xattr_ops() -> const XattrOps& {
    static const PosixXattrOps posix_ops;
    static const NullXattrOps null_ops;
    static const XattrOps& selected = [] () -> const XattrOps& {
        const XattrOps& ops = host_supports_xattr()
            ? static_cast<const XattrOps&>(posix_ops)
            : static_cast<const XattrOps&>(null_ops);
        spdlog::debug("Extended attribute backend: {}", ops.name());
        return ops;
    }();

    return selected;
}

} // namespace fcopy::adapters::xattr
