#include <filesystem>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include "catch2/catch_all.hpp"

#include "stagefmt/formatters/stagefmt_formatter_command.hpp"
#include "stagefmt/misc/current_path_scope.hpp"
#include "stagefmt/stagefmt_app.hpp"
#include "stagefmt/stagefmt_config.hpp"
#include "stagefmt/stagefmt_error.hpp"
#include "stagefmt/utils/processes.hpp"
#include "stagefmt/vcs/stagefmt_vcs_git.hpp"

#include "t_helpers.hpp"

namespace stagefmt::tests
{
    void git(const std::vector<std::string>& arguments)
    {
        std::vector<std::string> command {
            processes::find_program("git").value().string(),
            "-c",
            "user.name=stagefmt",
            "-c",
            "user.email=stagefmt@localhost",
            "-c",
            "commit.gpgsign=false",
        };

        command.insert(command.end(), arguments.begin(), arguments.end());

        processes::process_result result;
        REQUIRE(processes::run(command, result));
        INFO(result.err);
        REQUIRE(result.exit_status == 0);
    }

    /**
     * Repository with one commit containing "committed.rs" and "removed.rs", then staged: a new unformatted
     * "a.rs", a new formatted "b.rs", a modified unformatted "committed.rs", a new unformatted "notes.txt"
     * and the deletion of "removed.rs". "untracked.rs" is left out of the index.
     */
    void make_repository(const temp_directory& directory)
    {
        git({"init", "-q"});

        directory.write("committed.rs", "GOOD\n");
        directory.write("removed.rs", "GOOD\n");
        git({"add", "committed.rs", "removed.rs"});
        git({"commit", "-q", "-m", "initial"});

        directory.write("a.rs", "BAD\n");
        directory.write("b.rs", "GOOD\n");
        directory.write("src/committed.rs", "BAD\n");
        directory.write("committed.rs", "BAD\n");
        directory.write("notes.txt", "BAD\n");
        directory.write("untracked.rs", "BAD\n");
        git({"add", "a.rs", "b.rs", "committed.rs", "notes.txt", "src/committed.rs"});
        git({"rm", "-q", "removed.rs"});
    }
}

TEST_CASE("stagefmt::stagefmt_vcs_git", "[stagefmt][stagefmt::stagefmt_vcs_git][git]")
{
    using namespace stagefmt;

    if (!processes::find_program("git").has_value())
    {
        SKIP("git is not installed");
    }

    tests::temp_directory directory;
    current_path_scope scope {directory.path};
    tests::make_repository(directory);

    SECTION("root directory from a subdirectory")
    {
        current_path_scope sub_scope {directory.path / "src"};

        stagefmt_vcs_git vcs {"git"};

        std::string root;
        REQUIRE(vcs.root_directory(root));
        CHECK(std::filesystem::path(root) == directory.path);
    }

    SECTION("staged files exclude deletions and untracked files")
    {
        stagefmt_vcs_git vcs {"git"};

        std::vector<std::string> files;
        REQUIRE(vcs.list_staged_files(files));

        const std::vector<std::string> expected {"a.rs", "b.rs", "committed.rs", "notes.txt", "src/committed.rs"};
        CHECK(files == expected);
    }

    SECTION("outside of a repository")
    {
        tests::temp_directory outside;
        current_path_scope outside_scope {outside.path};

        stagefmt_vcs_git vcs {"git"};

        std::string root;
        CHECK_FALSE(vcs.root_directory(root));
    }

    SECTION("missing git program")
    {
        stagefmt_vcs_git vcs {"stagefmt-git-that-does-not-exist"};

        std::vector<std::string> files;
        try
        {
            std::ignore = vcs.list_staged_files(files);
            FAIL("expected vcs_not_found");
        }
        catch (const stagefmt_error& e)
        {
            CHECK(e.error_code == stagefmt_error_code::vcs_not_found);
        }
    }

    SECTION("hook run reformats unformatted staged files only")
    {
        directory.write_script("check.sh", "grep -q BAD \"$1\" && exit 1\nexit 0\n");
        directory.write_script("fix.sh", "for file in \"$@\"; do\n"
                                         "  sed 's/BAD/GOOD/g' \"$file\" > \"$file.tmp\" && mv \"$file.tmp\" \"$file\" || exit 2\n"
                                         "done\n");

        stagefmt_config config;
        config.check = (directory.path / "check.sh").string();
        config.fix = (directory.path / "fix.sh").string();

        stagefmt_app app {
            (directory.path / "src").string(),
            config,
            std::make_unique<stagefmt_vcs_git>(config.git),
            std::make_unique<stagefmt_formatter_command>(config),
        };

        tests::log_capture capture;

        CHECK(app.run() == stagefmt_result::reformatted);

        CHECK(directory.read("a.rs") == "GOOD\n");
        CHECK(directory.read("b.rs") == "GOOD\n");
        CHECK(directory.read("committed.rs") == "GOOD\n");
        CHECK(directory.read("src/committed.rs") == "GOOD\n");
        CHECK(directory.read("notes.txt") == "BAD\n");
        CHECK(directory.read("untracked.rs") == "BAD\n");
        CHECK_FALSE(std::filesystem::exists(directory.path / "removed.rs"));

        CHECK(capture.str() == "warning: reformatting staged files, stage them again and commit, files=a.rs committed.rs src/committed.rs\n");

        SECTION("second run is clean once files are staged again")
        {
            tests::git({"add", "a.rs", "committed.rs", "src/committed.rs"});

            tests::log_capture second_capture;

            CHECK(app.run() == stagefmt_result::clean);
            CHECK(second_capture.str().empty());
        }
    }
}
