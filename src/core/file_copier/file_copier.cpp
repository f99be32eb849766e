#include "file_copier.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"
#include "../../extensions/metadata.hpp"
#include "../../infra/hash/xxhash_verifier.hpp"

namespace fcopy::core {

FileCopier::FileCopier()
    : FileCopier(CopyOptions{}) {}

FileCopier::FileCopier(const CopyOptions& options)
    : FileCopier(options, adapters::xattr::select_xattr_ops()) {}

FileCopier::FileCopier(const CopyOptions& options, const adapters::xattr::XattrOps& xattrs)
    : options_(options), xattrs_(xattrs) {}

auto FileCopier::copy(const std::filesystem::path& source,
                      const std::filesystem::path& destination,
                      bool follow_symlinks,
                      bool copy_metadata) const
    -> infra::Result<std::filesystem::path>
{
    return copy(CopyRequest{
        .source = source,
        .destination = destination,
        .follow_symlinks = follow_symlinks,
        .copy_metadata = copy_metadata
    });
}

auto FileCopier::copy(const CopyRequest& request) const
    -> infra::Result<std::filesystem::path>
{
    const auto& src = request.source;
    const auto dst = resolve_destination(src, request.destination);
    spdlog::debug("Copying {} -> {}", src.string(), dst.string());

    if (is_same_file(src, dst)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SameFile,
            fmt::format("'{}' and '{}' are the same file", src.string(), dst.string())));
    }

    if (auto special = check_special_files_(src, dst); !special) {
        return std::unexpected(std::move(special.error()));
    }

    auto streamed = transfer_content_(src, dst, request.follow_symlinks);
    if (!streamed) {
        return std::unexpected(std::move(streamed.error()));
    }

    if (*streamed && options_.verify) {
        if (auto verified = verify_content_(src, dst); !verified) {
            return std::unexpected(std::move(verified.error()));
        }
    }

    if (request.copy_metadata) {
        auto meta = extensions::copy_metadata(src, dst, request.follow_symlinks, xattrs_);
        if (!meta) {
            return std::unexpected(std::move(meta.error()));
        }
    }

    return dst;
}

auto FileCopier::resolve_destination(const std::filesystem::path& source,
                                     const std::filesystem::path& destination)
    -> std::filesystem::path
{
    if (adapters::fs::is_directory(destination)) {
        return destination / source.filename();
    }
    return destination;
}

auto FileCopier::is_same_file(const std::filesystem::path& a,
                              const std::filesystem::path& b) -> bool
{
    // Если хотя бы один путь не существует, это разные файлы
    auto st_a = adapters::fs::stat_path(a);
    if (!st_a) return false;
    auto st_b = adapters::fs::stat_path(b);
    if (!st_b) return false;

    return st_a->st_dev == st_b->st_dev && st_a->st_ino == st_b->st_ino;
}

auto FileCopier::check_special_files_(const std::filesystem::path& source,
                                      const std::filesystem::path& destination) const
    -> infra::VoidResult
{
    // Сокеты и устройства не проверяются, только именованные каналы
    for (const auto* path : {&source, &destination}) {
        auto st = adapters::fs::stat_path(*path);
        if (!st) {
            // Назначения может ещё не быть; висячий симлинк-источник копируется как ссылка
            if (st.error().code == infra::ErrorCode::FileNotFound) continue;
            return std::unexpected(std::move(st.error()));
        }
        if (S_ISFIFO(st->st_mode)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::SpecialFile,
                fmt::format("'{}' is a named pipe", path->string())));
        }
    }
    return {};
}

auto FileCopier::transfer_content_(const std::filesystem::path& source,
                                   const std::filesystem::path& destination,
                                   bool follow_symlinks) const
    -> infra::Result<bool>
{
    if (!follow_symlinks && adapters::fs::is_symlink(source)) {
        auto target = adapters::fs::read_link(source);
        if (!target) {
            return std::unexpected(std::move(target.error()));
        }
        if (auto link = adapters::fs::create_symlink(*target, destination); !link) {
            return std::unexpected(std::move(link.error()));
        }
        spdlog::debug("Recreated symlink {} -> {}", destination.string(), *target);
        return false;
    }

    auto src_handle = adapters::fs::open_for_read(source);
    if (!src_handle) {
        return std::unexpected(std::move(src_handle.error()));
    }
    auto dst_handle = adapters::fs::open_for_write(destination);
    if (!dst_handle) {
        return std::unexpected(std::move(dst_handle.error()));
    }

    auto bytes = adapters::fs::copy_stream(*src_handle, *dst_handle);
    if (!bytes) {
        return std::unexpected(std::move(bytes.error()));
    }

    spdlog::debug("Copied {} bytes to {}", *bytes, destination.string());
    return true;
}

auto FileCopier::verify_content_(const std::filesystem::path& source,
                                 const std::filesystem::path& destination) const
    -> infra::VoidResult
{
    auto match = infra::XXHashVerifier::verify_files(source, destination);
    if (!match) {
        return std::unexpected(std::move(match.error()));
    }
    if (!*match) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ChecksumMismatch,
            fmt::format("Verification failed for {}", destination.string())));
    }
    return {};
}

auto make_request(const infra::Config& config,
                  const std::filesystem::path& source,
                  const std::filesystem::path& destination) -> CopyRequest
{
    return CopyRequest{
        .source = source,
        .destination = destination,
        .follow_symlinks = config.follow_symlinks,
        .copy_metadata = config.copy_metadata
    };
}

auto make_options(const infra::Config& config) -> CopyOptions {
    return CopyOptions{.verify = config.verify};
}

} // namespace fcopy::core
