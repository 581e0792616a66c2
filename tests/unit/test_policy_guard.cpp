#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/ids.hpp"
#include "core/errors/hearth_errors.hpp"
#include "policy/policy_guard.hpp"

namespace {

using hearth::core::errors::ErrorCategory;
using hearth::core::errors::get_error;
using hearth::core::errors::get_value;
using hearth::core::errors::is_error;
using hearth::policy::PolicyGuard;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::temp_directory_path() /
                (".tmp_policy_guard_" + hearth::core::config::generate_id("ws"));
        std::filesystem::create_directories(root_ / "sub");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

TEST(PolicyGuardTest, AllowsPathInsideRoot) {
    TempWorkspace workspace;
    write_file(workspace.root() / "sub/sample.csv", "ok");

    PolicyGuard guard;
    auto result = guard.validate_path_in_root(workspace.root(), "sub/sample.csv");
    ASSERT_FALSE(is_error(result));

    const auto resolved = get_value(result);
    EXPECT_TRUE(resolved.is_absolute());
    EXPECT_EQ(resolved.filename().string(), "sample.csv");
}

TEST(PolicyGuardTest, AllowsNotYetExistingChild) {
    TempWorkspace workspace;
    PolicyGuard guard;
    auto result = guard.validate_path_in_root(workspace.root(), "report-1/chart.png");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).filename().string(), "chart.png");
}

TEST(PolicyGuardTest, RejectsTraversalOutOfRoot) {
    TempWorkspace workspace;
    PolicyGuard guard;
    auto result = guard.validate_path_in_root(workspace.root() / "sub", "../../etc/passwd");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Security);
    EXPECT_EQ(get_error(result).code, "path_outside_root");
}

TEST(PolicyGuardTest, RejectsSiblingWithSharedPrefix) {
    TempWorkspace workspace;
    const auto sibling = workspace.root() / "sub-evil" / "x.csv";
    write_file(sibling, "x");

    PolicyGuard guard;
    auto result = guard.validate_path_in_root(workspace.root() / "sub", sibling);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_root");
}

TEST(PolicyGuardTest, RejectsSymlinkEscape) {
    TempWorkspace workspace;
    const auto outside = std::filesystem::temp_directory_path();
    std::filesystem::create_directory_symlink(outside, workspace.root() / "sub/link");

    PolicyGuard guard;
    auto result = guard.validate_path_in_root(workspace.root() / "sub", "link/anything");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_root");
}

TEST(PolicyGuardTest, RejectsInvalidRoot) {
    PolicyGuard guard;
    const auto missing_root = std::filesystem::temp_directory_path() /
                              ("__missing_root__" + hearth::core::config::generate_id("r"));
    auto result = guard.validate_path_in_root(missing_root, "a.csv");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_root");
}

TEST(PolicyGuardTest, IdentifierAllowsSafeCharactersOnly) {
    PolicyGuard guard;
    auto ok = guard.validate_identifier("conv_2024-01", "report id");
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok), "conv_2024-01");

    for (const std::string bad : {"..", "../etc", "a/b", "a\\b", ".hidden", "sp ace", ""}) {
        auto result = guard.validate_identifier(bad, "report id");
        ASSERT_TRUE(is_error(result)) << bad;
        EXPECT_EQ(get_error(result).category, ErrorCategory::Security) << bad;
        EXPECT_EQ(get_error(result).code, "invalid_identifier") << bad;
    }

    EXPECT_TRUE(is_error(guard.validate_identifier(std::string("ab\0cd", 5), "report id")));
    EXPECT_TRUE(is_error(guard.validate_identifier(std::string(256, 'a'), "report id")));
}

TEST(PolicyGuardTest, FilenameAllowsInteriorDots) {
    PolicyGuard guard;
    EXPECT_FALSE(is_error(guard.validate_filename("chart-1.png")));
    EXPECT_FALSE(is_error(guard.validate_filename("data.v2.csv")));

    for (const std::string bad : {"..", "...png", ".png", "a/b.png", "a..b.csv", ""}) {
        auto result = guard.validate_filename(bad);
        ASSERT_TRUE(is_error(result)) << bad;
        EXPECT_EQ(get_error(result).code, "invalid_filename") << bad;
    }
}

}  // namespace
