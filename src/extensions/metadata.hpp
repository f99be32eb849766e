// src/extensions/metadata.hpp
#pragma once

#include <cstddef>
#include <filesystem>
#include "infra/error_handler/error.hpp"
#include "adapters/xattr.hpp"

namespace fcopy::extensions {

/// Копирует метаданные src -> dst: время доступа/модификации (нс),
/// расширенные атрибуты, биты прав и, где есть, BSD-флаги.
/// Ссылки не разыменовываются, только если follow_symlinks == false
/// и оба конца являются символическими ссылками.
[[nodiscard]] auto copy_metadata(const std::filesystem::path& src,
                                 const std::filesystem::path& dst,
                                 bool follow_symlinks,
                                 const adapters::xattr::XattrOps& xattrs)
    -> infra::VoidResult;

/// Копирует все xattr с перезаписью. Возвращает число скопированных атрибутов.
/// Ошибка списка ENOTSUP/ENODATA/EINVAL - ноль атрибутов; ошибка отдельного
/// атрибута EPERM/ENOTSUP/ENODATA/EINVAL - атрибут пропускается.
[[nodiscard]] auto copy_xattrs(const std::filesystem::path& src,
                               const std::filesystem::path& dst,
                               bool follow_symlinks,
                               const adapters::xattr::XattrOps& xattrs)
    -> infra::Result<std::size_t>;

} // namespace fcopy::extensions
