/*
 * Command-line driver tests - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <cmd-runner/cli/cli.hpp>
#include <cmd-runner/log/error_category.hpp>
#include <cerrno>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>
#include <unistd.h>

using namespace cmdrun;

namespace {

// Temporary file removed at scope exit.
struct TempFile {
    explicit TempFile(const std::string& content) {
        char tmpl[] = "/tmp/cmd_runner_cli_XXXXXX";
        int fd = mkstemp(tmpl);
        if (fd >= 0) close(fd);
        path = tmpl;
        std::ofstream(path) << content;
    }
    ~TempFile() { unlink(path.c_str()); }
    std::string path;
};

int cli(std::vector<std::string> args) {
    args.insert(args.begin(), "cmd-runner");
    std::vector<char*> argv;
    for (auto &a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    return run_cli(static_cast<int>(args.size()), argv.data());
}

class ThrowingSpawner : public ProcessSpawner {
public:
    std::unique_ptr<ChildProcess> spawn(const SpawnRequest&) override {
        throw std::system_error(EAGAIN, std::generic_category(), "thread");
    }
};

struct CliTest : ::testing::Test {
    void TearDown() override { set_error_category(ErrorCategory::Undefined); }
    TempFile empty_config{""};
};

} // namespace

TEST_F(CliTest, ChildExitCodePassedThrough) {
    EXPECT_EQ(cli({"--config", empty_config.path, "--", "/bin/false"}), 1);
    EXPECT_EQ(cli({"--config", empty_config.path, "--", "/bin/true"}), 0);
}

TEST_F(CliTest, SpawnError) {
    EXPECT_EQ(cli({"--config", empty_config.path, "--", "cmd-runner-no-such-prog"}), kCliSpawnError);
}

TEST_F(CliTest, UsageErrors) {
    EXPECT_EQ(cli({}), kCliUsageError);
    EXPECT_EQ(cli({"--bogus"}), kCliUsageError);
    // Both a script and a command.
    EXPECT_EQ(cli({"--script", empty_config.path, "--", "/bin/true"}), kCliUsageError);
    EXPECT_EQ(cli({"--config", empty_config.path, "--script", "/nonexistent/script.sh"}), kCliUsageError);
}

TEST_F(CliTest, ConfigErrors) {
    TempFile bad("not a setting\n");
    EXPECT_EQ(cli({"--config", bad.path, "--", "/bin/true"}), kCliUsageError);
    EXPECT_EQ(cli({"--config", "/nonexistent/cmd-runnerrc", "--", "/bin/true"}), kCliUsageError);
}

TEST_F(CliTest, ScriptWithCategory) {
    TempFile config("pattern.build=build broke\n");
    TempFile script("echo 'build broke here' >&2\nexit 4\n");
    testing::internal::CaptureStderr();
    int rc = cli({"--config", config.path, "--script", script.path});
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(rc, 4);
    EXPECT_NE(err.find("build broke here\n"), std::string::npos);
    EXPECT_NE(err.find("error category: build\n"), std::string::npos);
}

TEST_F(CliTest, CustomCategoryPrintsConfiguredName) {
    TempFile config("pattern.licensing=license * expired\n");
    TempFile script("echo 'license key expired'\n");
    testing::internal::CaptureStderr();
    testing::internal::CaptureStdout();
    int rc = cli({"--config", config.path, "--script", script.path});
    testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(rc, 0);
    EXPECT_NE(err.find("error category: licensing\n"), std::string::npos);
}

TEST_F(CliTest, NoCategoryLineWithoutMatch) {
    TempFile config("pattern.build=build broke\n");
    testing::internal::CaptureStderr();
    int rc = cli({"--config", config.path, "--", "/bin/true"});
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(rc, 0);
    EXPECT_EQ(err.find("error category:"), std::string::npos);
}

TEST_F(CliTest, OtherFailureReturnsOne) {
    std::vector<std::string> args = {"cmd-runner", "--config", empty_config.path, "--", "/bin/true"};
    std::vector<char*> argv;
    for (auto &a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    EXPECT_EQ(run_cli(static_cast<int>(args.size()), argv.data(), std::make_shared<ThrowingSpawner>()), 1);
}
