// metadata.cpp
#include "metadata.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <span>
#include <spdlog/spdlog.h>

#include "adapters/fs.hpp"

namespace fcopy::extensions {

namespace {

// Ошибки, при которых список атрибутов считается пустым
constexpr std::array XATTR_LIST_TOLERATED{ENOTSUP, ENODATA, EINVAL};

// Ошибки, при которых отдельный атрибут пропускается
constexpr std::array XATTR_ENTRY_TOLERATED{EPERM, ENOTSUP, ENODATA, EINVAL};

// Хост не умеет менять время/права у самой ссылки
constexpr std::array NOFOLLOW_UNSUPPORTED{ENOTSUP, EOPNOTSUPP, ENOSYS};

#if FCOPY_HAS_ST_FLAGS
constexpr std::array FLAGS_TOLERATED{ENOTSUP, EOPNOTSUPP};
#endif

auto is_tolerated(const infra::Error& err, std::span<const int> allowed) -> bool {
    const int e = err.os_errno();
    return e != 0 && std::ranges::find(allowed, e) != allowed.end();
}

} // namespace

auto copy_xattrs(const std::filesystem::path& src,
                 const std::filesystem::path& dst,
                 bool follow_symlinks,
                 const adapters::xattr::XattrOps& xattrs)
    -> infra::Result<std::size_t>
{
    auto names = xattrs.list_names(src, follow_symlinks);
    if (!names) {
        if (is_tolerated(names.error(), XATTR_LIST_TOLERATED)) {
            spdlog::debug("No extended attributes on {}: {}", src.string(), names.error().message);
            return std::size_t{0};
        }
        return std::unexpected(std::move(names.error()));
    }

    std::size_t copied = 0;
    for (const auto& name : *names) {
        auto value = xattrs.get_value(src, name, follow_symlinks);
        if (!value) {
            if (is_tolerated(value.error(), XATTR_ENTRY_TOLERATED)) {
                spdlog::debug("Skipping xattr {}: {}", name, value.error().message);
                continue;
            }
            return std::unexpected(std::move(value.error()));
        }

        auto set = xattrs.set_value(dst, name, *value, follow_symlinks);
        if (!set) {
            if (is_tolerated(set.error(), XATTR_ENTRY_TOLERATED)) {
                spdlog::debug("Skipping xattr {}: {}", name, set.error().message);
                continue;
            }
            return std::unexpected(std::move(set.error()));
        }
        ++copied;
    }
    return copied;
}

auto copy_metadata(const std::filesystem::path& src,
                   const std::filesystem::path& dst,
                   bool follow_symlinks,
                   const adapters::xattr::XattrOps& xattrs)
    -> infra::VoidResult
{
    // Не следуем по ссылкам только когда обе стороны - ссылки
    const bool follow = follow_symlinks
        || !(adapters::fs::is_symlink(src) && adapters::fs::is_symlink(dst));

    auto st = adapters::fs::stat_path(src, follow);
    if (!st) {
        return std::unexpected(std::move(st.error()));
    }

    // Временные метки
    auto times = adapters::fs::set_times(dst, *st, follow);
    if (!times) {
        if (follow || !is_tolerated(times.error(), NOFOLLOW_UNSUPPORTED)) {
            return std::unexpected(std::move(times.error()));
        }
        spdlog::debug("Symlink timestamps not supported for {}", dst.string());
    }

    // Расширенные атрибуты
    auto copied = copy_xattrs(src, dst, follow, xattrs);
    if (!copied) {
        return std::unexpected(std::move(copied.error()));
    }

    // Права
    const mode_t mode = st->st_mode & 07777;
    auto perms = adapters::fs::set_mode(dst, mode, follow);
    if (!perms) {
        if (follow || !is_tolerated(perms.error(), NOFOLLOW_UNSUPPORTED)) {
            return std::unexpected(std::move(perms.error()));
        }
        spdlog::debug("Symlink mode change not supported for {}", dst.string());
    }

#if FCOPY_HAS_ST_FLAGS
    auto flags = adapters::fs::set_flags(dst, st->st_flags, follow);
    if (!flags && !is_tolerated(flags.error(), FLAGS_TOLERATED)) {
        return std::unexpected(std::move(flags.error()));
    }
#endif

    spdlog::debug("Copied metadata {} -> {} ({} xattrs, mode {:o})",
                  src.string(), dst.string(), *copied, mode);
    return {};
}

} // namespace fcopy::extensions
