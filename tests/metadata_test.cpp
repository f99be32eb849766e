#include <gtest/gtest.h>

#include <cerrno>
#include <map>
#include <type_traits>
#include <string>
#include <vector>

#include "core/file_copier/file_copier.hpp"
#include "extensions/metadata.hpp"
#include "adapters/xattr.hpp"
#include "test_utils.hpp"

using fcopy::adapters::xattr::XattrOps;
using fcopy::adapters::xattr::NullXattrOps;
using fcopy::infra::Result;
using fcopy::infra::VoidResult;
using fcopy::infra::make_os_error;
using fcopy::testing::TempDir;
using fcopy::testing::write_file;
using fcopy::testing::read_file;

namespace {

// Атрибуты в памяти; ошибки задаются errno по имени атрибута
class FakeXattrOps final : public XattrOps {
public:
    int list_errno = 0;
    std::map<std::string, std::string> source_attrs;
    std::map<std::string, int> get_errnos;
    std::map<std::string, int> set_errnos;
    mutable std::map<std::string, std::string> written;

    auto list_names(const std::filesystem::path&, bool) const
        -> Result<std::vector<std::string>> override
    {
        if (list_errno != 0) {
            return std::unexpected(make_os_error(list_errno, "listxattr"));
        }
        std::vector<std::string> names;
        for (const auto& [name, value] : source_attrs) {
            names.push_back(name);
        }
        return names;
    }

    auto get_value(const std::filesystem::path&, const std::string& name, bool) const
        -> Result<std::string> override
    {
        if (auto it = get_errnos.find(name); it != get_errnos.end()) {
            return std::unexpected(make_os_error(it->second, "getxattr"));
        }
        return source_attrs.at(name);
    }

    auto set_value(const std::filesystem::path&, const std::string& name,
                   const std::string& value, bool) const
        -> VoidResult override
    {
        if (auto it = set_errnos.find(name); it != set_errnos.end()) {
            return std::unexpected(make_os_error(it->second, "setxattr"));
        }
        written[name] = value;
        return {};
    }

    auto name() const -> std::string_view override { return "fake"; }
};

} // namespace

TEST(XattrCopyTest, CopiesEveryAttribute)
{
    TempDir dir;
    write_file(dir / "a", "x");
    write_file(dir / "b", "x");

    FakeXattrOps ops;
    ops.source_attrs = {{"user.one", "1"}, {"user.two", std::string("\0\x01\x02", 3)}};

    auto copied = fcopy::extensions::copy_xattrs(dir / "a", dir / "b", true, ops);

    ASSERT_TRUE(copied) << copied.error().message;
    EXPECT_EQ(*copied, 2u);
    EXPECT_EQ(ops.written, ops.source_attrs);
}

TEST(XattrCopyTest, UnsupportedListingMeansNoAttributes)
{
    TempDir dir;
    for (int err : {ENOTSUP, ENODATA, EINVAL}) {
        FakeXattrOps ops;
        ops.list_errno = err;

        auto copied = fcopy::extensions::copy_xattrs(dir / "a", dir / "b", true, ops);

        ASSERT_TRUE(copied) << "errno " << err;
        EXPECT_EQ(*copied, 0u);
    }
}

TEST(XattrCopyTest, OtherListingErrorPropagates)
{
    TempDir dir;
    FakeXattrOps ops;
    ops.list_errno = EIO;

    auto copied = fcopy::extensions::copy_xattrs(dir / "a", dir / "b", true, ops);

    ASSERT_FALSE(copied);
    EXPECT_EQ(copied.error().os_errno(), EIO);
}

TEST(XattrCopyTest, ToleratedSetErrorSkipsOnlyThatAttribute)
{
    TempDir dir;
    FakeXattrOps ops;
    ops.source_attrs = {{"security.label", "s0"}, {"user.a", "1"}, {"user.b", "2"}};
    ops.set_errnos = {{"security.label", EPERM}};

    auto copied = fcopy::extensions::copy_xattrs(dir / "a", dir / "b", true, ops);

    ASSERT_TRUE(copied) << copied.error().message;
    EXPECT_EQ(*copied, 2u);
    EXPECT_EQ(ops.written.count("security.label"), 0u);
    EXPECT_EQ(ops.written.at("user.a"), "1");
    EXPECT_EQ(ops.written.at("user.b"), "2");
}

TEST(XattrCopyTest, ToleratedGetErrorSkipsOnlyThatAttribute)
{
    TempDir dir;
    FakeXattrOps ops;
    ops.source_attrs = {{"user.gone", "x"}, {"user.kept", "y"}};
    ops.get_errnos = {{"user.gone", ENODATA}};

    auto copied = fcopy::extensions::copy_xattrs(dir / "a", dir / "b", true, ops);

    ASSERT_TRUE(copied);
    EXPECT_EQ(*copied, 1u);
    EXPECT_EQ(ops.written.count("user.kept"), 1u);
}

TEST(XattrCopyTest, UntoleratedSetErrorPropagates)
{
    TempDir dir;
    FakeXattrOps ops;
    ops.source_attrs = {{"user.a", "1"}, {"user.b", "2"}, {"user.c", "3"}};
    ops.set_errnos = {{"user.b", ENOSPC}};

    auto copied = fcopy::extensions::copy_xattrs(dir / "a", dir / "b", true, ops);

    ASSERT_FALSE(copied);
    EXPECT_EQ(copied.error().os_errno(), ENOSPC);
    EXPECT_EQ(copied.error().code, fcopy::infra::ErrorCode::DiskFull);
    // Атрибуты до ошибки уже записаны, после - нет
    EXPECT_EQ(ops.written.count("user.a"), 1u);
    EXPECT_EQ(ops.written.count("user.c"), 0u);
}

TEST(XattrCopyTest, NullBackendCopiesNothing)
{
    TempDir dir;
    NullXattrOps ops;

    auto copied = fcopy::extensions::copy_xattrs(dir / "a", dir / "b", true, ops);

    ASSERT_TRUE(copied);
    EXPECT_EQ(*copied, 0u);
    EXPECT_EQ(ops.name(), "none");
}

TEST(XattrCopyTest, LinuxSelectsPosixBackend)
{
#ifdef __linux__
    EXPECT_TRUE(fcopy::adapters::xattr::host_supports_xattr());
    EXPECT_EQ(fcopy::adapters::xattr::select_xattr_ops().name(), "posix");
#else
    GTEST_SKIP() << "Linux only";
#endif
}

TEST(MetadataTest, CopyWithUnsupportedXattrsStillSucceeds)
{
    TempDir dir;
    write_file(dir / "a", "content");

    FakeXattrOps ops;
    ops.list_errno = ENOTSUP;
    fcopy::core::FileCopier copier{fcopy::core::CopyOptions{}, ops};

    auto res = copier.copy(dir / "a", dir / "b", true, true);

    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(read_file(dir / "b"), "content");
    EXPECT_TRUE(ops.written.empty());
}

TEST(MetadataTest, XattrFailureAfterContentCopyPropagates)
{
    TempDir dir;
    write_file(dir / "a", "content");

    FakeXattrOps ops;
    ops.source_attrs = {{"user.a", "1"}};
    ops.set_errnos = {{"user.a", EIO}};
    fcopy::core::FileCopier copier{fcopy::core::CopyOptions{}, ops};

    auto res = copier.copy(dir / "a", dir / "b", true, true);

    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().os_errno(), EIO);
    // Содержимое уже скопировано и не откатывается
    EXPECT_EQ(read_file(dir / "b"), "content");
}

TEST(MetadataTest, MissingSourceStatPropagates)
{
    TempDir dir;
    write_file(dir / "b", "x");
    NullXattrOps ops;

    auto res = fcopy::extensions::copy_metadata(dir / "missing", dir / "b", true, ops);

    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, fcopy::infra::ErrorCode::FileNotFound);
}

TEST(MetadataTest, XattrBackendIsBorrowedNotOwned)
{
    using fcopy::core::FileCopier;
    using fcopy::core::CopyOptions;

    // Временный backend не может быть привязан к копировщику
    static_assert(!std::is_constructible_v<FileCopier, const CopyOptions&, NullXattrOps>);
    static_assert(!std::is_constructible_v<FileCopier, const CopyOptions&, FakeXattrOps&&>);
    static_assert(std::is_constructible_v<FileCopier, const CopyOptions&, const NullXattrOps&>);

    TempDir dir;
    write_file(dir / "a", "content");
    NullXattrOps ops;
    FileCopier copier{CopyOptions{}, ops};

    auto res = copier.copy(dir / "a", dir / "b", true, true);
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(read_file(dir / "b"), "content");
}
