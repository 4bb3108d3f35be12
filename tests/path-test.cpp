#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>

#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

#include "error.hpp"
#include "path.hpp"

namespace {
class ResolvePath : public ::testing::Test {
  protected:
    std::optional<std::string> saved_path;

    auto SetUp() -> void override {
        if(const auto env = getenv("PATH"); env != nullptr) {
            saved_path = env;
        }
    }

    auto TearDown() -> void override {
        if(saved_path) {
            setenv("PATH", saved_path->data(), 1);
        } else {
            unsetenv("PATH");
        }
    }
};

auto make_file(const std::string& path, const mode_t mode) -> void {
    std::ofstream(path) << "#!/bin/sh\n";
    ASSERT_EQ(chmod(path.data(), mode), 0);
}

TEST_F(ResolvePath, FindsOnSearchPath) {
    auto       error = std::error_code();
    const auto path  = launcher::resolve_path("sh", error);
    ASSERT_FALSE(error) << error.message();
    EXPECT_EQ(path.front(), '/');
    EXPECT_EQ(path.substr(path.size() - 3), "/sh");
    EXPECT_EQ(access(path.data(), X_OK), 0);
}

TEST_F(ResolvePath, UnknownIsNotFound) {
    auto error = std::error_code();
    EXPECT_TRUE(launcher::resolve_path("zzzUnknownzzz", error).empty());
    EXPECT_EQ(error, launcher::Error::NotFound);

    EXPECT_TRUE(launcher::resolve_path("", error).empty());
    EXPECT_EQ(error, launcher::Error::NotFound);
}

TEST_F(ResolvePath, SlashNameIsCheckedDirectly) {
    auto error = std::error_code();
    EXPECT_EQ(launcher::resolve_path("/bin/sh", error), "/bin/sh");
    EXPECT_FALSE(error);

    launcher::resolve_path("/nonexistent/zzzUnknownzzz", error);
    EXPECT_EQ(error, launcher::Error::NotFound);
}

TEST_F(ResolvePath, SkipsNonExecutables) {
    char dir_template[] = "/tmp/launcher-path-XXXXXX";
    ASSERT_NE(mkdtemp(dir_template), nullptr);
    const auto dir = std::string(dir_template);
    make_file(dir + "/plain", 0644);
    make_file(dir + "/tool", 0755);

    ASSERT_EQ(setenv("PATH", dir.data(), 1), 0);
    auto error = std::error_code();
    EXPECT_EQ(launcher::resolve_path("tool", error), dir + "/tool");
    EXPECT_FALSE(error);

    launcher::resolve_path("plain", error);
    EXPECT_EQ(error, launcher::Error::NotFound);

    // a directory is never executable
    launcher::resolve_path(dir, error);
    EXPECT_EQ(error, std::errc::permission_denied);

    unlink((dir + "/plain").data());
    unlink((dir + "/tool").data());
    rmdir(dir.data());
}

TEST_F(ResolvePath, EmptySearchPath) {
    auto error = std::error_code();
    ASSERT_EQ(unsetenv("PATH"), 0);
    launcher::resolve_path("sh", error);
    EXPECT_EQ(error, launcher::Error::NotFound);

    ASSERT_EQ(setenv("PATH", "", 1), 0);
    launcher::resolve_path("sh", error);
    EXPECT_EQ(error, launcher::Error::NotFound);
}
} // namespace
