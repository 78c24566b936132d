#include <gtest/gtest.h>
#include <platform/process.hpp>
#include <platform/platform.hpp>
#include <fstream>
#include <sstream>
#include <thread>
#include <chrono>
#include <signal.h>
#include <filesystem>

namespace fs = std::filesystem;

using platform::LaunchOptions;
using platform::ProgramError;

class ProcessTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = platform::temp_file("kanri_process_test");
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    static LaunchOptions sh(const std::string& script) {
        LaunchOptions opts;
        opts.program = "/bin/sh";
        opts.args = {"-c", script};
        opts.quiet = true;
        return opts;
    }

    std::string read_file(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(ProcessTest, SuccessfulCommand) {
    auto r = platform::launch(sh("exit 0"));
    EXPECT_TRUE(r.is_ok());
}

TEST_F(ProcessTest, NonZeroExitCarriesCode) {
    auto r = platform::launch(sh("exit 3"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ProgramError::Kind::NonZeroExitCode);
    EXPECT_EQ(r.error.exit_code, 3);
    EXPECT_EQ(r.error.program, "/bin/sh");
}

TEST_F(ProcessTest, MissingProgramIsNotFound) {
    LaunchOptions opts;
    opts.program = "kanri-definitely-not-a-real-program";
    opts.quiet = true;

    auto r = platform::launch(opts);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ProgramError::Kind::ProgramNotFound);
    EXPECT_EQ(r.error.program, "kanri-definitely-not-a-real-program");
}

TEST_F(ProcessTest, MissingProgramInForkModeIsReported) {
    LaunchOptions opts;
    opts.program = "kanri-definitely-not-a-real-program";
    opts.fork_mode = true;
    opts.quiet = true;

    auto r = platform::launch(opts);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ProgramError::Kind::ProgramNotFound);
}

TEST_F(ProcessTest, NonExecutableFileIsNoPermission) {
    fs::path script = test_dir / "not-executable.sh";
    std::ofstream(script) << "#!/bin/sh\nexit 0\n";
    fs::permissions(script, fs::perms::owner_read | fs::perms::owner_write);

    LaunchOptions opts;
    opts.program = script.string();
    opts.quiet = true;

    auto r = platform::launch(opts);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ProgramError::Kind::NoPermission);
}

TEST_F(ProcessTest, KilledBySignalIsInterrupted) {
    auto r = platform::launch(sh("kill -TERM $$"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ProgramError::Kind::ProcessInterrupted);
}

TEST_F(ProcessTest, QuietChildInterruptLeavesCallerRunning) {
    // The child sends SIGINT to both itself and this process, as Ctrl-C does to
    // a foreground process group.
    auto r = platform::launch(sh("kill -INT $PPID; kill -INT $$"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ProgramError::Kind::ProcessInterrupted);
}

TEST_F(ProcessTest, InteractiveChildInterruptLeavesCallerRunning) {
    auto opts = sh("kill -INT $PPID; kill -INT $$");
    opts.quiet = false;
    auto r = platform::launch(opts);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ProgramError::Kind::ProcessInterrupted);
}

TEST_F(ProcessTest, ChildGetsDefaultInterruptHandling) {
    // The parent's shield must not leak into the child: an ignored SIGINT
    // would let the script reach the exit 0.
    struct sigaction dfl {}, old {};
    dfl.sa_handler = SIG_DFL;
    sigemptyset(&dfl.sa_mask);
    sigaction(SIGINT, &dfl, &old);

    auto r = platform::launch(sh("kill -INT $$; exit 0"));
    sigaction(SIGINT, &old, nullptr);

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ProgramError::Kind::ProcessInterrupted);
}

TEST_F(ProcessTest, RunsInWorkingDirectory) {
    auto opts = sh("pwd > where.txt");
    opts.cwd = test_dir;

    ASSERT_TRUE(platform::launch(opts).is_ok());
    std::string where = read_file(test_dir / "where.txt");
    EXPECT_EQ(fs::canonical(where.substr(0, where.find('\n'))), fs::canonical(test_dir));
}

TEST_F(ProcessTest, MissingWorkingDirectoryIsError) {
    auto opts = sh("exit 0");
    opts.cwd = test_dir / "does-not-exist";

    auto r = platform::launch(opts);
    EXPECT_TRUE(r.is_err());
}

TEST_F(ProcessTest, EnvironmentOverridesAreVisible) {
    auto opts = sh("printf '%s' \"$KANRI_PROJECT\" > env.txt");
    opts.cwd = test_dir;
    opts.env = {{"KANRI_PROJECT", "demo"}};

    ASSERT_TRUE(platform::launch(opts).is_ok());
    EXPECT_EQ(read_file(test_dir / "env.txt"), "demo");
}

TEST_F(ProcessTest, InheritedEnvironmentIsKept) {
    auto opts = sh("test -n \"$PATH\"");
    opts.env = {{"KANRI_PROJECT", "demo"}};
    EXPECT_TRUE(platform::launch(opts).is_ok());
}

TEST_F(ProcessTest, ArgumentsAreNotReSplit) {
    auto opts = sh("printf '%s|' \"$@\" > args.txt");
    opts.args.push_back("argv0");
    opts.args.push_back("two words");
    opts.args.push_back("");
    opts.cwd = test_dir;

    ASSERT_TRUE(platform::launch(opts).is_ok());
    EXPECT_EQ(read_file(test_dir / "args.txt"), "two words||");
}

TEST_F(ProcessTest, ForkModeReturnsBeforeChildExits) {
    auto opts = sh("sleep 2; touch done.txt");
    opts.cwd = test_dir;
    opts.fork_mode = true;

    auto started = std::chrono::steady_clock::now();
    ASSERT_TRUE(platform::launch(opts).is_ok());
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::seconds(1));
    EXPECT_FALSE(fs::exists(test_dir / "done.txt"));
}

TEST_F(ProcessTest, SpawnAndWait) {
    auto spawned = platform::spawn(sh("exit 7"));
    ASSERT_TRUE(spawned.is_ok());
    ASSERT_TRUE(spawned.value.valid());

    auto r = spawned.value.wait();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.exit_code, 7);
}

TEST(ProgramErrorTest, DescribeNamesProgram) {
    ProgramError e;
    e.kind = ProgramError::Kind::NonZeroExitCode;
    e.program = "cargo";
    e.exit_code = 101;
    EXPECT_EQ(platform::describe(e), "'cargo' exited with status 101");

    e.kind = ProgramError::Kind::ProgramNotFound;
    EXPECT_EQ(platform::describe(e), "program 'cargo' was not found");
}

TEST(WindowsQuotingTest, PlainArgumentIsUnchanged) {
    EXPECT_EQ(platform::quote_windows_arg("notepad.exe"), "notepad.exe");
    EXPECT_EQ(platform::quote_windows_arg("C:\\dir\\file"), "C:\\dir\\file");
}

TEST(WindowsQuotingTest, SpacesAndEmptyAreQuoted) {
    EXPECT_EQ(platform::quote_windows_arg("a b"), "\"a b\"");
    EXPECT_EQ(platform::quote_windows_arg(""), "\"\"");
}

TEST(WindowsQuotingTest, BackslashesBeforeQuotesAreDoubled) {
    // a\"b  ->  "a\\\"b"
    EXPECT_EQ(platform::quote_windows_arg("a\\\"b"), "\"a\\\\\\\"b\"");
    // trailing backslash before the closing quote
    EXPECT_EQ(platform::quote_windows_arg("C:\\my dir\\"), "\"C:\\my dir\\\\\"");
}
