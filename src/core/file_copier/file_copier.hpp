#pragma once

#include <filesystem>
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../adapters/xattr.hpp"

namespace fcopy::core {

struct CopyRequest {
    std::filesystem::path source;
    std::filesystem::path destination;   // файл или существующий каталог
    bool follow_symlinks = true;
    bool copy_metadata = false;
};

struct CopyOptions {
    bool verify = false; // сравнить xxHash64 источника и назначения после копирования
};

/// Копирует содержимое одного файла и, по запросу, его метаданные.
///
/// Порядок:
///   1. каталог назначения -> destination / source.filename()
///   2. один и тот же файл (dev + inode) -> ErrorCode::SameFile
///   3. FIFO на любом конце -> ErrorCode::SpecialFile
///   4. симлинк воссоздаётся (follow_symlinks == false) или данные копируются чанками
///   5. метаданные (copy_metadata)
/// Проверки 2 и 3 выполняются до любой записи в назначение.
/// При ошибке в середине копирования частично записанный файл не удаляется.
class FileCopier {
public:
    FileCopier();
    explicit FileCopier(const CopyOptions& options);
    FileCopier(const CopyOptions& options, const adapters::xattr::XattrOps& xattrs);
    // xattrs хранится по ссылке и должен пережить FileCopier
    FileCopier(const CopyOptions& options, const adapters::xattr::XattrOps&& xattrs) = delete;

    [[nodiscard]] auto copy(const CopyRequest& request) const
        -> infra::Result<std::filesystem::path>;

    [[nodiscard]] auto copy(const std::filesystem::path& source,
                            const std::filesystem::path& destination,
                            bool follow_symlinks = true,
                            bool copy_metadata = false) const
        -> infra::Result<std::filesystem::path>;

    [[nodiscard]] static auto resolve_destination(const std::filesystem::path& source,
                                                  const std::filesystem::path& destination)
        -> std::filesystem::path;

    [[nodiscard]] static auto is_same_file(const std::filesystem::path& a,
                                           const std::filesystem::path& b) -> bool;

private:
    [[nodiscard]] auto check_special_files_(const std::filesystem::path& source,
                                            const std::filesystem::path& destination) const
        -> infra::VoidResult;

    // true, если данные были скопированы потоком (а не воссоздан симлинк)
    [[nodiscard]] auto transfer_content_(const std::filesystem::path& source,
                                         const std::filesystem::path& destination,
                                         bool follow_symlinks) const
        -> infra::Result<bool>;

    [[nodiscard]] auto verify_content_(const std::filesystem::path& source,
                                       const std::filesystem::path& destination) const
        -> infra::VoidResult;

    CopyOptions options_;
    const adapters::xattr::XattrOps& xattrs_;
};

[[nodiscard]] auto make_request(const infra::Config& config,
                                const std::filesystem::path& source,
                                const std::filesystem::path& destination) -> CopyRequest;

[[nodiscard]] auto make_options(const infra::Config& config) -> CopyOptions;

} // namespace fcopy::core
