#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/request_id.hpp"
#include "core/errors/dispatch_errors.hpp"
#include "policy/policy_guard.hpp"

namespace {

using cidispatch::core::errors::ErrorCategory;
using cidispatch::core::errors::get_error;
using cidispatch::core::errors::get_value;
using cidispatch::core::errors::is_error;
using cidispatch::policy::EnvironmentPolicy;
using cidispatch::policy::PolicyGuard;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_policy_guard_" + cidispatch::core::config::generate_request_id());
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

std::string lookup(const cidispatch::policy::EnvironmentList& env, const std::string& name) {
    for (const auto& [key, value] : env) {
        if (key == name) {
            return value;
        }
    }
    return "<unset>";
}

TEST(PolicyGuardTest, AllowsPathInsideWorkspace) {
    TempWorkspace workspace;
    write_file(workspace.root() / "sub/sample.cpp", "int x;");

    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), "sub/sample.cpp");
    ASSERT_FALSE(is_error(result));

    const auto resolved = get_value(result);
    EXPECT_TRUE(resolved.is_absolute());
    EXPECT_EQ(resolved.filename().string(), "sample.cpp");
}

TEST(PolicyGuardTest, RejectsPathOutsideWorkspace) {
    TempWorkspace workspace;
    const auto outside = workspace.root().parent_path() / "outside.txt";
    write_file(outside, "outside");

    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), outside);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");
    EXPECT_EQ(get_error(result).category, ErrorCategory::Policy);

    std::error_code ec;
    std::filesystem::remove(outside, ec);
}

TEST(PolicyGuardTest, RejectsDotDotEscape) {
    TempWorkspace workspace;
    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), "sub/../../elsewhere");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");
}

TEST(PolicyGuardTest, RejectsSymlinkPointingOutside) {
    TempWorkspace workspace;
    std::error_code ec;
    std::filesystem::create_directory_symlink(workspace.root().parent_path(),
                                              workspace.root() / "escape", ec);
    ASSERT_FALSE(ec);

    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), "escape");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");
}

TEST(PolicyGuardTest, SiblingWithSharedPrefixIsOutside) {
    TempWorkspace workspace;
    const auto sibling = std::filesystem::path(workspace.root().string() + "-sibling");
    std::filesystem::create_directories(sibling);

    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), sibling);
    EXPECT_TRUE(is_error(result));

    std::error_code ec;
    std::filesystem::remove_all(sibling, ec);
}

TEST(PolicyGuardTest, RejectsInvalidWorkspaceRoot) {
    PolicyGuard guard;
    const auto missing_root =
        std::filesystem::current_path() /
        ("__missing_workspace_root__" + cidispatch::core::config::generate_request_id());
    std::error_code ec;
    std::filesystem::remove_all(missing_root, ec);
    auto result = guard.validate_path_in_workspace(missing_root, "a.cpp");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_workspace_root");
}

TEST(PolicyGuardTest, RejectsOptionLikeFileArgument) {
    PolicyGuard guard;
    auto result = guard.validate_file_argument("--fix");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "option_like_path");
}

TEST(PolicyGuardTest, RejectsEmptyFileArgument) {
    PolicyGuard guard;
    auto result = guard.validate_file_argument("");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_path");
}

TEST(PolicyGuardTest, AllowsPlainFileArgument) {
    PolicyGuard guard;
    auto result = guard.validate_file_argument("src/main.cpp");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "src/main.cpp");
}

TEST(PolicyGuardTest, ChildEnvironmentKeepsOnlyAllowlist) {
    ASSERT_EQ(setenv("CIDISPATCH_TEST_SECRET", "hunter2", 1), 0);
    ASSERT_EQ(setenv("CIDISPATCH_TEST_VISIBLE", "yes", 1), 0);

    EnvironmentPolicy policy;
    policy.passthrough = {"CIDISPATCH_TEST_VISIBLE"};
    PolicyGuard guard(policy);
    const auto env = guard.child_environment({{"GH_TOKEN", "abc"}});

    EXPECT_EQ(lookup(env, "CIDISPATCH_TEST_VISIBLE"), "yes");
    EXPECT_EQ(lookup(env, "GH_TOKEN"), "abc");
    EXPECT_EQ(lookup(env, "CIDISPATCH_TEST_SECRET"), "<unset>");
    ASSERT_EQ(unsetenv("CIDISPATCH_TEST_SECRET"), 0);
    ASSERT_EQ(unsetenv("CIDISPATCH_TEST_VISIBLE"), 0);
}

TEST(PolicyGuardTest, ExtraEnvironmentOverridesParent) {
    ASSERT_EQ(setenv("CIDISPATCH_TEST_MODE", "parent", 1), 0);
    EnvironmentPolicy policy;
    policy.passthrough = {"CIDISPATCH_TEST_MODE"};
    PolicyGuard guard(policy);
    const auto env = guard.child_environment({{"CIDISPATCH_TEST_MODE", "child"}});
    EXPECT_EQ(lookup(env, "CIDISPATCH_TEST_MODE"), "child");

    std::size_t count = 0;
    for (const auto& entry : env) {
        if (entry.first == "CIDISPATCH_TEST_MODE") {
            ++count;
        }
    }
    EXPECT_EQ(count, 1u);
    ASSERT_EQ(unsetenv("CIDISPATCH_TEST_MODE"), 0);
}

TEST(PolicyGuardTest, DisplayPathIsWorkspaceRelative) {
    const std::filesystem::path root = "/work/project";
    EXPECT_EQ(PolicyGuard::display_path(root, "/work/project/src/a.cpp"), "src/a.cpp");
    EXPECT_EQ(PolicyGuard::display_path(root, "src/b.cpp"), "src/b.cpp");
    EXPECT_EQ(PolicyGuard::display_path(root, "/usr/include/stdio.h"), "/usr/include/stdio.h");
}

}  // namespace
