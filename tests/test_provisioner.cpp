#include <gtest/gtest.h>
#include <managers/provisioner.hpp>
#include <platform/platform.hpp>
#include <fstream>
#include <sstream>

using platform::LaunchOptions;
using platform::ProgramError;

class ProvisionerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    Library library;
    TemplateStore templates;
    Profile profile;

    void SetUp() override {
        test_dir = platform::temp_file("kanri_provision_test");
        fs::create_directories(test_dir);

        auto opened = Library::open(test_dir, false);
        ASSERT_TRUE(opened.is_ok());
        library = std::move(opened.value);

        profile.shell = "/bin/sh";
        profile.shell_args = {"-c"};
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string read_file(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static Result<void, ProgramError> exit_with(const LaunchOptions& opts, int code) {
        if (code == 0) return Result<void, ProgramError>::Ok();
        ProgramError e;
        e.kind = ProgramError::Kind::NonZeroExitCode;
        e.program = opts.program;
        e.exit_code = code;
        return Result<void, ProgramError>::Err(e);
    }
};

// ── Real shell ───────────────────────────────────────────────

TEST_F(ProvisionerTest, RunsCommandsInsideNewProject) {
    templates.add("basic", {"echo one > log.txt", "echo \"$KANRI_PROJECT\" >> log.txt"});

    Provisioner provisioner(library, templates, profile);
    auto r = provisioner.provision({"fresh", "basic", true});
    ASSERT_TRUE(r.is_ok()) << describe(r.error);

    EXPECT_EQ(provisioner.state(), ProvisionState::Completed);
    EXPECT_TRUE(library.contains("fresh"));
    EXPECT_EQ(read_file(test_dir / "fresh" / "log.txt"), "one\nfresh\n");
}

TEST_F(ProvisionerTest, FailingCommandRollsBack) {
    templates.add("broken", {"touch created.txt", "exit 4", "touch never.txt"});

    Provisioner provisioner(library, templates, profile);
    auto r = provisioner.provision({"fragile", "broken", true});
    ASSERT_TRUE(r.is_err());

    EXPECT_EQ(provisioner.state(), ProvisionState::RolledBack);
    EXPECT_EQ(r.error.kind, ProvisionError::Kind::CommandFailed);
    EXPECT_EQ(r.error.command, "exit 4");
    EXPECT_EQ(r.error.command_index, 1u);
    EXPECT_EQ(r.error.program.kind, ProgramError::Kind::NonZeroExitCode);
    EXPECT_EQ(r.error.program.exit_code, 4);
    EXPECT_FALSE(r.error.cleanup_error.has_value());

    EXPECT_FALSE(fs::exists(test_dir / "fragile"));
    EXPECT_FALSE(library.contains("fragile"));
}

// ── Injected runner ──────────────────────────────────────────

TEST_F(ProvisionerTest, CommandsRunInOrderWithProjectContext) {
    templates.add("steps", {"cmd1", "cmd2", "cmd3"});
    std::vector<LaunchOptions> seen;
    auto runner = [&](const LaunchOptions& opts) {
        seen.push_back(opts);
        return exit_with(opts, 0);
    };

    std::vector<std::pair<size_t, size_t>> progress;
    Provisioner provisioner(library, templates, profile, runner);
    auto r = provisioner.provision({"ordered", "steps", false},
        [&](const std::string&, size_t current, size_t total) {
            progress.push_back({current, total});
        });
    ASSERT_TRUE(r.is_ok());

    ASSERT_EQ(seen.size(), 3u);
    for (size_t i = 0; i < seen.size(); i++) {
        EXPECT_EQ(seen[i].program, "/bin/sh");
        std::vector<std::string> args = {"-c", "cmd" + std::to_string(i + 1)};
        EXPECT_EQ(seen[i].args, args);
        ASSERT_TRUE(seen[i].cwd.has_value());
        EXPECT_EQ(*seen[i].cwd, test_dir / "ordered");
        EXPECT_FALSE(seen[i].fork_mode);
        EXPECT_FALSE(seen[i].quiet);
        ASSERT_EQ(seen[i].env.size(), 1u);
        EXPECT_EQ(seen[i].env[0].first, "KANRI_PROJECT");
        EXPECT_EQ(seen[i].env[0].second, "ordered");
    }

    std::vector<std::pair<size_t, size_t>> expected = {{1, 3}, {2, 3}, {3, 3}};
    EXPECT_EQ(progress, expected);
}

TEST_F(ProvisionerTest, StopsAtFirstFailure) {
    templates.add("pair", {"cmd1", "cmd2", "cmd3"});
    std::vector<std::string> ran;
    auto runner = [&](const LaunchOptions& opts) {
        ran.push_back(opts.args.back());
        return exit_with(opts, opts.args.back() == "cmd2" ? 1 : 0);
    };

    Provisioner provisioner(library, templates, profile, runner);
    auto r = provisioner.provision({"halted", "pair", true});
    ASSERT_TRUE(r.is_err());

    std::vector<std::string> expected = {"cmd1", "cmd2"};
    EXPECT_EQ(ran, expected);
    EXPECT_EQ(r.error.command, "cmd2");
    EXPECT_FALSE(fs::exists(test_dir / "halted"));
    EXPECT_NE(describe(r.error).find("'cmd2'"), std::string::npos);
}

TEST_F(ProvisionerTest, CleanupFailureIsReportedAlongsideCause) {
    templates.add("sabotage", {"cmd1"});

    // The command itself deletes the project, so the compensating remove fails.
    auto runner = [&](const LaunchOptions& opts) {
        fs::remove_all(*opts.cwd);
        return exit_with(opts, 2);
    };

    Provisioner provisioner(library, templates, profile, runner);
    auto r = provisioner.provision({"vanishing", "sabotage", true});
    ASSERT_TRUE(r.is_err());

    EXPECT_EQ(provisioner.state(), ProvisionState::RolledBack);
    EXPECT_EQ(r.error.kind, ProvisionError::Kind::CommandFailed);
    EXPECT_EQ(r.error.command, "cmd1");
    EXPECT_EQ(r.error.program.exit_code, 2);
    ASSERT_TRUE(r.error.cleanup_error.has_value());
    EXPECT_EQ(r.error.cleanup_error->kind, LibraryError::Kind::DirectoryNotFound);

    // Remove did not succeed, so the entry stays
    EXPECT_TRUE(library.contains("vanishing"));

    std::string message = describe(r.error);
    EXPECT_NE(message.find("'cmd1'"), std::string::npos);
    EXPECT_NE(message.find("cleanup failed"), std::string::npos);
}

TEST_F(ProvisionerTest, UnknownTemplateCreatesNothing) {
    Provisioner provisioner(library, templates, profile);
    auto r = provisioner.provision({"orphan", "missing", true});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ProvisionError::Kind::TemplateNotFound);
    EXPECT_EQ(provisioner.state(), ProvisionState::Idle);
    EXPECT_FALSE(fs::exists(test_dir / "orphan"));
}

TEST_F(ProvisionerTest, EmptyShellCreatesNothing) {
    templates.add("any", {"true"});
    profile.shell.clear();

    Provisioner provisioner(library, templates, profile);
    auto r = provisioner.provision({"shell-less", "any", true});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ProvisionError::Kind::ShellNotConfigured);
    EXPECT_FALSE(fs::exists(test_dir / "shell-less"));
}

TEST_F(ProvisionerTest, CreateFailureRunsNoCommands) {
    templates.add("any", {"cmd1"});
    fs::create_directories(test_dir / "taken");
    bool ran = false;
    auto runner = [&](const LaunchOptions& opts) {
        ran = true;
        return exit_with(opts, 0);
    };

    Provisioner provisioner(library, templates, profile, runner);
    auto r = provisioner.provision({"taken", "any", true});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ProvisionError::Kind::CreateFailed);
    ASSERT_TRUE(r.error.create_error.has_value());
    EXPECT_EQ(r.error.create_error->kind, LibraryError::Kind::AlreadyExists);
    EXPECT_FALSE(ran);

    // Existing directory is left alone
    EXPECT_TRUE(fs::is_directory(test_dir / "taken"));
}
