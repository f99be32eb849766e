#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace fcopy::adapters::xattr {

/// Операции с расширенными атрибутами (xattr).
/// Все ошибки возвращаются с исходным errno в Error::os_error,
/// решение о допустимости ошибки принимает вызывающая сторона.
class XattrOps {
public:
    virtual ~XattrOps() = default;

    [[nodiscard]] virtual auto list_names(const std::filesystem::path& path,
                                          bool follow_symlinks) const
        -> infra::Result<std::vector<std::string>> = 0;

    [[nodiscard]] virtual auto get_value(const std::filesystem::path& path,
                                         const std::string& name,
                                         bool follow_symlinks) const
        -> infra::Result<std::string> = 0;

    // Перезаписывает существующее значение
    [[nodiscard]] virtual auto set_value(const std::filesystem::path& path,
                                         const std::string& name,
                                         const std::string& value,
                                         bool follow_symlinks) const
        -> infra::VoidResult = 0;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

// Системные вызовы listxattr/getxattr/setxattr (Linux, macOS)
class PosixXattrOps final : public XattrOps {
public:
    [[nodiscard]] auto list_names(const std::filesystem::path& path,
                                  bool follow_symlinks) const
        -> infra::Result<std::vector<std::string>> override;

    [[nodiscard]] auto get_value(const std::filesystem::path& path,
                                 const std::string& name,
                                 bool follow_symlinks) const
        -> infra::Result<std::string> override;

    [[nodiscard]] auto set_value(const std::filesystem::path& path,
                                 const std::string& name,
                                 const std::string& value,
                                 bool follow_symlinks) const
        -> infra::VoidResult override;

    [[nodiscard]] auto name() const -> std::string_view override { return "posix"; }
};

// Хост без xattr: атрибутов нет, копировать нечего
class NullXattrOps final : public XattrOps {
public:
    [[nodiscard]] auto list_names(const std::filesystem::path&, bool) const
        -> infra::Result<std::vector<std::string>> override
    {
        return std::vector<std::string>{};
    }

    [[nodiscard]] auto get_value(const std::filesystem::path&, const std::string&, bool) const
        -> infra::Result<std::string> override
    {
        return std::string{};
    }

    [[nodiscard]] auto set_value(const std::filesystem::path&, const std::string&,
                                 const std::string&, bool) const
        -> infra::VoidResult override
    {
        return {};
    }

    [[nodiscard]] auto name() const -> std::string_view override { return "none"; }
};

/// Есть ли у хоста системные вызовы xattr (listxattr не отвечает ENOSYS).
[[nodiscard]] auto host_supports_xattr() -> bool;

/// Выбирает реализацию один раз за процесс по результату host_supports_xattr().
[[nodiscard]] auto select_xattr_ops() -> const XattrOps&;

} // namespace fcopy::adapters::xattr
