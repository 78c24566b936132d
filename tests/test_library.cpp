#include <gtest/gtest.h>
#include <managers/library.hpp>
#include <platform/platform.hpp>
#include <fstream>
#include <unistd.h>

class LibraryTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = platform::temp_file("kanri_library_test");
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(test_dir, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(test_dir, ec);
    }

    void make_dir(const std::string& name) {
        fs::create_directories(test_dir / name);
    }

    void write_file(const std::string& rel_path, const std::string& content = "") {
        auto full = test_dir / rel_path;
        fs::create_directories(full.parent_path());
        std::ofstream(full) << content;
    }

    Library open(bool display_hidden = false) {
        auto lib = Library::open(test_dir, display_hidden);
        EXPECT_TRUE(lib.is_ok()) << (lib.is_err() ? describe(lib.error) : "");
        return std::move(lib.value);
    }
};

// ── Scan ─────────────────────────────────────────────────────

TEST_F(LibraryTest, OpenMissingRootIsInvalidPath) {
    auto lib = Library::open(test_dir / "nope", false);
    ASSERT_TRUE(lib.is_err());
    EXPECT_EQ(lib.error.kind, LibraryError::Kind::InvalidPath);
}

TEST_F(LibraryTest, OpenFileRootIsInvalidPath) {
    write_file("plain.txt", "x");
    auto lib = Library::open(test_dir / "plain.txt", false);
    ASSERT_TRUE(lib.is_err());
    EXPECT_EQ(lib.error.kind, LibraryError::Kind::InvalidPath);
}

TEST_F(LibraryTest, ScanListsDirectoriesOnly) {
    make_dir("alpha");
    make_dir("beta");
    write_file("notes.txt", "not a project");

    Library lib = open();
    EXPECT_EQ(lib.size(), 2u);
    EXPECT_TRUE(lib.contains("alpha"));
    EXPECT_TRUE(lib.contains("beta"));
    EXPECT_FALSE(lib.contains("notes.txt"));
}

TEST_F(LibraryTest, ScanOrderIsSortedByName) {
    make_dir("zeta");
    make_dir("alpha");
    make_dir("mid");

    Library lib = open();
    std::vector<std::string> expected = {"alpha", "mid", "zeta"};
    EXPECT_EQ(lib.names(), expected);
}

TEST_F(LibraryTest, HiddenEntriesFollowFlag) {
    make_dir(".config-project");
    make_dir("visible");

    Library hidden_off = open(false);
    EXPECT_FALSE(hidden_off.contains(".config-project"));
    EXPECT_TRUE(hidden_off.contains("visible"));

    Library hidden_on = open(true);
    EXPECT_TRUE(hidden_on.contains(".config-project"));
    EXPECT_TRUE(hidden_on.contains("visible"));
}

TEST_F(LibraryTest, SystemDirectoriesNeverListed) {
    make_dir("$RECYCLE.BIN");
    make_dir("System Volume Information");
    make_dir(".Trash-1000");
    make_dir("work");

    Library lib = open(true);
    EXPECT_EQ(lib.size(), 1u);
    EXPECT_TRUE(lib.contains("work"));
}

TEST_F(LibraryTest, IgnoreFileDropsExactNames) {
    make_dir("keep");
    make_dir("archive");
    make_dir("archive2");
    write_file(".ignore", "# old stuff\n\n  archive  \n");

    Library lib = open();
    EXPECT_TRUE(lib.contains("keep"));
    EXPECT_FALSE(lib.contains("archive"));
    EXPECT_TRUE(lib.contains("archive2"));
}

TEST_F(LibraryTest, IgnoreFileAppliesWithHiddenShown) {
    make_dir("a");
    make_dir("b");
    make_dir(".b");
    make_dir(".c");
    make_dir("c");
    write_file(".ignore", "a\n#comment\n\nb\n.b");

    std::vector<std::string> expected = {".c", "c"};
    EXPECT_EQ(open(true).names(), expected);

    std::vector<std::string> visible = {"c"};
    EXPECT_EQ(open(false).names(), visible);
}

TEST_F(LibraryTest, ScanFiltersHiddenAndSystemTogether) {
    make_dir("a");
    make_dir(".b");
    make_dir("$RECYCLE.BIN");

    std::vector<std::string> hidden_off = {"a"};
    EXPECT_EQ(open(false).names(), hidden_off);

    // Sorted by name, so the dot entry comes first
    std::vector<std::string> hidden_on = {".b", "a"};
    EXPECT_EQ(open(true).names(), hidden_on);
}

TEST_F(LibraryTest, SymlinkToDirectoryIsListed) {
    fs::path target = platform::temp_file("kanri_library_link_target");
    fs::create_directories(target);
    fs::create_directory_symlink(target, test_dir / "linked");

    Library lib = open();
    EXPECT_TRUE(lib.contains("linked"));

    fs::remove_all(target);
}

TEST_F(LibraryTest, UnreadableRootFailsScan) {
    if (geteuid() == 0) GTEST_SKIP() << "root bypasses permission checks";

    make_dir("alpha");
    fs::permissions(test_dir, fs::perms::owner_read | fs::perms::owner_exec,
                    fs::perm_options::remove);

    auto lib = Library::open(test_dir, false);
    ASSERT_TRUE(lib.is_err());
    EXPECT_EQ(lib.error.kind, LibraryError::Kind::PermissionDenied);
}

// ── create ───────────────────────────────────────────────────

TEST_F(LibraryTest, CreateThenGet) {
    Library lib = open();
    auto r = lib.create("my-project_1");
    ASSERT_TRUE(r.is_ok()) << describe(r.error);

    const Project* p = lib.get("my-project_1");
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->path, test_dir / "my-project_1");
    EXPECT_TRUE(lib.contains("my-project_1"));
    EXPECT_TRUE(fs::is_directory(test_dir / "my-project_1"));
}

TEST_F(LibraryTest, CreateAppendsToIndex) {
    make_dir("b");
    Library lib = open();
    ASSERT_TRUE(lib.create("a").is_ok());

    std::vector<std::string> expected = {"b", "a"};
    EXPECT_EQ(lib.names(), expected);
}

TEST_F(LibraryTest, CreateTwiceIsAlreadyExists) {
    Library lib = open();
    ASSERT_TRUE(lib.create("dup").is_ok());
    write_file("dup/marker", "keep me");

    auto second = lib.create("dup");
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(second.error.kind, LibraryError::Kind::AlreadyExists);
    EXPECT_EQ(lib.size(), 1u);
    EXPECT_TRUE(fs::exists(test_dir / "dup" / "marker"));
}

TEST_F(LibraryTest, CreateOverFileIsAlreadyExists) {
    write_file("taken", "x");
    Library lib = open();

    auto r = lib.create("taken");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, LibraryError::Kind::AlreadyExists);
}

TEST_F(LibraryTest, CreateRejectsInvalidName) {
    Library lib = open();

    auto r = lib.create("a/b");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, LibraryError::Kind::InvalidProjectName);
    EXPECT_EQ(r.error.name_error, NameError::InvalidCharacters);
    EXPECT_FALSE(fs::exists(test_dir / "a"));

    auto empty = lib.create("");
    ASSERT_TRUE(empty.is_err());
    EXPECT_TRUE(lib.empty());
}

TEST_F(LibraryTest, CreateInReadOnlyRootIsPermissionDenied) {
    if (geteuid() == 0) GTEST_SKIP() << "root bypasses permission checks";

    Library lib = open();
    fs::permissions(test_dir, fs::perms::owner_write, fs::perm_options::remove);

    auto r = lib.create("blocked");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, LibraryError::Kind::PermissionDenied);
    EXPECT_FALSE(lib.contains("blocked"));
}

// ── remove ───────────────────────────────────────────────────

TEST_F(LibraryTest, RemoveDeletesRecursively) {
    write_file("doomed/src/main.cpp", "int main() {}");
    Library lib = open();

    auto r = lib.remove("doomed");
    ASSERT_TRUE(r.is_ok()) << describe(r.error);
    EXPECT_FALSE(fs::exists(test_dir / "doomed"));
    EXPECT_FALSE(lib.contains("doomed"));
}

TEST_F(LibraryTest, RemoveMissingDirectoryKeepsIndex) {
    make_dir("gone");
    Library lib = open();
    fs::remove_all(test_dir / "gone");

    auto r = lib.remove("gone");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, LibraryError::Kind::DirectoryNotFound);
    EXPECT_TRUE(lib.contains("gone"));
}

TEST_F(LibraryTest, RemoveRefusesRootEscapes) {
    make_dir("inner");
    Library lib = open();

    for (const char* name : {"", ".", "..", "inner/.."}) {
        auto r = lib.remove(name);
        ASSERT_TRUE(r.is_err()) << name;
        EXPECT_EQ(r.error.kind, LibraryError::Kind::ProjectNotFound) << name;
    }
    EXPECT_TRUE(fs::is_directory(test_dir / "inner"));
}

// ── rename ───────────────────────────────────────────────────

TEST_F(LibraryTest, RenameMovesDirectoryAndKeepsPosition) {
    make_dir("a");
    make_dir("b");
    make_dir("c");
    Library lib = open();

    auto r = lib.rename("b", "bee");
    ASSERT_TRUE(r.is_ok()) << describe(r.error);

    std::vector<std::string> expected = {"a", "bee", "c"};
    EXPECT_EQ(lib.names(), expected);
    EXPECT_EQ(lib.get("bee")->path, test_dir / "bee");
    EXPECT_TRUE(fs::is_directory(test_dir / "bee"));
    EXPECT_FALSE(fs::exists(test_dir / "b"));
}

TEST_F(LibraryTest, RenameUnknownIsProjectNotFound) {
    Library lib = open();
    auto r = lib.rename("ghost", "spirit");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, LibraryError::Kind::ProjectNotFound);
}

TEST_F(LibraryTest, RenameOntoIndexedProjectIsAlreadyExists) {
    make_dir("one");
    make_dir("two");
    Library lib = open();

    auto r = lib.rename("one", "two");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, LibraryError::Kind::AlreadyExists);
    EXPECT_TRUE(fs::is_directory(test_dir / "one"));
}

TEST_F(LibraryTest, RenameOntoHiddenEntryIsAlreadyExists) {
    make_dir("one");
    make_dir(".hidden");
    Library lib = open(false);

    auto r = lib.rename("one", ".hidden");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, LibraryError::Kind::AlreadyExists);
    EXPECT_TRUE(lib.contains("one"));
}

TEST_F(LibraryTest, RenameRejectsInvalidDestination) {
    make_dir("one");
    Library lib = open();

    auto r = lib.rename("one", "bad:name");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, LibraryError::Kind::InvalidProjectName);
    EXPECT_TRUE(lib.contains("one"));
}

TEST_F(LibraryTest, FailedRenameLeavesIndexUntouched) {
    make_dir("a");
    make_dir("b");
    Library lib = open();
    auto before = lib.names();

    // Directory disappears behind the snapshot's back
    fs::remove_all(test_dir / "a");

    auto r = lib.rename("a", "z");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, LibraryError::Kind::DirectoryNotFound);
    EXPECT_EQ(lib.names(), before);
    EXPECT_EQ(lib.get("a")->path, test_dir / "a");
    EXPECT_FALSE(lib.contains("z"));
}

// ── Lookups ──────────────────────────────────────────────────

TEST_F(LibraryTest, SnapshotDoesNotSeeExternalChanges) {
    Library lib = open();
    make_dir("late");
    EXPECT_FALSE(lib.contains("late"));
    EXPECT_EQ(lib.get("late"), nullptr);
}

TEST_F(LibraryTest, IsProjectEmptyIsLive) {
    make_dir("box");
    Library lib = open();

    auto empty = lib.is_project_empty("box");
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value);

    write_file("box/item", "x");
    auto full = lib.is_project_empty("box");
    ASSERT_TRUE(full.is_ok());
    EXPECT_FALSE(full.value);

    auto missing = lib.is_project_empty("nope");
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error.kind, LibraryError::Kind::ProjectNotFound);
}

// ── clone ────────────────────────────────────────────────────

TEST_F(LibraryTest, CloneBuildsGitCommandLine) {
    Library lib = open();
    platform::LaunchOptions seen;
    auto runner = [&](const platform::LaunchOptions& opts) {
        seen = opts;
        return Result<void, platform::ProgramError>::Ok();
    };

    CloneOptions options;
    options.remote = "https://example.com/repo.git";
    options.name = "repo-copy";
    options.branch = "dev";

    auto r = lib.clone_repository(options, runner);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(seen.program, "git");
    std::vector<std::string> expected = {"clone", "https://example.com/repo.git", "repo-copy", "-b", "dev"};
    EXPECT_EQ(seen.args, expected);
    ASSERT_TRUE(seen.cwd.has_value());
    EXPECT_EQ(*seen.cwd, test_dir);
}

TEST_F(LibraryTest, CloneFailureWrapsProgramError) {
    Library lib = open();
    auto runner = [](const platform::LaunchOptions& opts) {
        platform::ProgramError e;
        e.kind = platform::ProgramError::Kind::NonZeroExitCode;
        e.program = opts.program;
        e.exit_code = 128;
        return Result<void, platform::ProgramError>::Err(e);
    };

    CloneOptions options;
    options.remote = "https://example.com/missing.git";

    auto r = lib.clone_repository(options, runner);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, LibraryError::Kind::CloneFailed);
    EXPECT_EQ(r.error.program.exit_code, 128);
}

TEST_F(LibraryTest, CloneRejectsTakenName) {
    make_dir("repo");
    Library lib = open();
    bool ran = false;
    auto runner = [&](const platform::LaunchOptions&) {
        ran = true;
        return Result<void, platform::ProgramError>::Ok();
    };

    CloneOptions options;
    options.remote = "https://example.com/repo.git";
    options.name = "repo";

    auto r = lib.clone_repository(options, runner);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, LibraryError::Kind::AlreadyExists);
    EXPECT_FALSE(ran);
}
