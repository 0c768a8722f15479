/**
 * @file test_application.cpp
 * @brief Tests of argument parsing and the command line session
 *
 * Sessions run against real files below a private temporary directory.
 * Operator input comes from an istringstream and panels go to a plain text
 * view, so no terminal is involved.
 *
 * @see Application
 */

#include <gtest/gtest.h>
#include "application.hpp"
#include "errors.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

/**
 * @brief ReportView writing one line per panel
 */
class TextView : public ReportView {
public:
    std::ostringstream out;
    int groupsShown = 0;

    void showGroup(const DuplicateGroup& group, const std::vector<FileRecord>& records,
                   const std::string& keeper) override {
        ++groupsShown;
        out << "group " << group.id << ":";
        for (const auto& record : records) {
            out << ' ' << record.getDisplayName();
        }
        out << " keeper " << keeper << '\n';
    }

    void showSimilarities(const std::vector<PairSimilarity>& pairs) override {
        out << "similarities " << pairs.size() << '\n';
    }

    void showMovePlan(const std::vector<MoveOperation>& moves, bool dryRun) override {
        out << (dryRun ? "planned " : "moves ") << moves.size() << '\n';
    }

    void showPreview(const std::string& path, const std::string&) override {
        out << "preview " << path << '\n';
    }
};

/** @brief Reports no free space anywhere */
class FullFileSystem : public LocalFileSystem {
public:
    std::uintmax_t availableSpace(const fs::path&) const override {
        return 0;
    }
};

CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "neardup-cli");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    return Application::parseArguments(static_cast<int>(argv.size()), argv.data());
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

} // namespace

TEST(ApplicationArgumentsTest, RejectsUnknownFlag) {
    EXPECT_THROW({ parse({"--frobnicate", "/data"}); }, InvalidArgumentError);
}

TEST(ApplicationArgumentsTest, RejectsBadThreshold) {
    EXPECT_THROW({ parse({"--threshold", "abc", "/data"}); }, InvalidArgumentError);
    EXPECT_THROW({ parse({"--threshold", "1.5", "/data"}); }, InvalidArgumentError);
    EXPECT_THROW({ parse({"/data", "--threshold"}); }, InvalidArgumentError);
}

TEST(ApplicationArgumentsTest, RequiresAPath) {
    EXPECT_THROW({ parse({"--dry-run"}); }, InvalidArgumentError);
    EXPECT_TRUE(parse({"--help"}).help);
}

/**
 * @test PriorityPathsStopAtNextFlag
 * @brief --priority-paths takes values up to the next flag; later
 *        positional arguments are paths again
 */
TEST(ApplicationArgumentsTest, PriorityPathsStopAtNextFlag) {
    auto options = parse({"--priority-paths", "important/*", "*.md", "--dry-run",
                          "/data", "--retention", "largest", "--priority-first"});

    EXPECT_EQ(options.config.retention.getPriorityPatterns(),
              (std::vector<std::string>{"important/*", "*.md"}));
    EXPECT_TRUE(options.config.retention.isPriorityFirst());
    EXPECT_EQ(options.config.retention.getStrategy(), RetentionStrategy::Largest);
    EXPECT_TRUE(options.config.move.dryRun);
    EXPECT_EQ(options.paths, (std::vector<fs::path>{"/data"}));

    EXPECT_THROW({ parse({"--priority-paths", "--dry-run", "/data"}); },
                 InvalidArgumentError);
}

TEST(ApplicationArgumentsTest, UnknownRetentionIsAnInvalidStrategy) {
    try {
        parse({"--retention", "biggest", "/data"});
        FAIL() << "expected InvalidStrategyError";
    } catch (const InvalidStrategyError& e) {
        EXPECT_EQ(e.getName(), "biggest");
    }
}

TEST(ApplicationArgumentsTest, ModeAndScanOptions) {
    auto options = parse({"--mode", "non-interactive", "--num-perm", "64",
                          "--no-follow-symlinks", "--holding-dir", "/tmp/h", "/data"});

    EXPECT_FALSE(options.interactive);
    EXPECT_EQ(options.config.signature.numPerm, 64u);
    EXPECT_FALSE(options.config.scan.resolver.followSymlinks);
    EXPECT_EQ(options.config.move.holdingDir, fs::path("/tmp/h"));

    EXPECT_THROW({ parse({"--mode", "batch", "/data"}); }, InvalidArgumentError);
    EXPECT_THROW({ parse({"--num-perm", "-4", "/data"}); }, InvalidArgumentError);
}

class ApplicationTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path data_dir;
    fs::path holding_dir;
    Logger quiet{nullptr};
    LocalFileSystem local;
    TextView view;
    std::ostringstream out;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() /
                   ("neardup_app_" + std::string(info->name()) + "_" +
                    std::to_string(::getpid()));
        fs::create_directories(test_dir / "data");
        test_dir = fs::canonical(test_dir);
        data_dir = test_dir / "data";
        holding_dir = test_dir / "holding";
    }

    void TearDown() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    /** @brief Writes a file under data/ and backdates it by hours */
    fs::path createFile(const std::string& name, const std::string& content, int hours) {
        auto path = data_dir / name;
        {
            std::ofstream file(path);
            file << content;
        }
        fs::last_write_time(path, fs::file_time_type::clock::now() -
                                      std::chrono::hours(hours));
        return path;
    }

    void createDuplicates(int count) {
        const char* names[] = {"a.txt", "b.txt", "c.txt"};
        for (int i = 0; i < count; ++i) {
            createFile(names[i], "hello world this is a test", count - i);
        }
    }

    CliOptions options(std::vector<std::string> extra = {}) {
        extra.push_back("--holding-dir");
        extra.push_back(holding_dir.string());
        extra.push_back(data_dir.string());
        return parse(extra);
    }

    int run(const CliOptions& cli, const std::string& input,
            IFileSystem* fileSystem = nullptr) {
        std::istringstream in(input);
        Application app(view, fileSystem ? *fileSystem : local, in, out, quiet);
        return app.run(cli);
    }

    std::size_t filesIn(const fs::path& dir) const {
        std::size_t count = 0;
        if (!fs::exists(dir)) {
            return 0;
        }
        for (const auto& entry : fs::recursive_directory_iterator(dir)) {
            if (entry.is_regular_file()) {
                ++count;
            }
        }
        return count;
    }
};

TEST_F(ApplicationTest, NothingToDoExitsCleanly) {
    createFile("a.txt", "hello world this is a test", 2);
    createFile("b.txt", "completely unrelated notes about fish and chips", 1);

    EXPECT_EQ(run(options({"--mode", "non-interactive"}), ""), Application::EXIT_OK);
    EXPECT_TRUE(contains(out.str(), "No similar files found"));

    out.str("");
    EXPECT_EQ(run(options(), ""), Application::EXIT_OK);
    EXPECT_TRUE(contains(out.str(), "No more duplicate groups found."));
    EXPECT_EQ(view.groupsShown, 0);
}

TEST_F(ApplicationTest, EmptyDirectoryHasNoTextFiles) {
    EXPECT_EQ(run(options(), ""), Application::EXIT_OK);
    EXPECT_TRUE(contains(out.str(), "No valid text files found."));
}

TEST_F(ApplicationTest, NonInteractiveConsolidates) {
    createDuplicates(2);

    EXPECT_EQ(run(options({"--mode", "non-interactive"}), ""), Application::EXIT_OK);
    EXPECT_FALSE(fs::exists(data_dir / "a.txt"));
    EXPECT_TRUE(fs::exists(data_dir / "b.txt"));
    EXPECT_EQ(filesIn(holding_dir), 1u);
    EXPECT_TRUE(contains(out.str(), "Successfully moved all files"));
}

/**
 * @test NonInteractiveFailsWithoutSpace
 * @brief A failed space check aborts with exit code 1 and moves nothing
 */
TEST_F(ApplicationTest, NonInteractiveFailsWithoutSpace) {
    createDuplicates(2);
    FullFileSystem full;

    EXPECT_EQ(run(options({"--mode", "non-interactive"}), "", &full),
              Application::EXIT_ABORT);
    EXPECT_TRUE(fs::exists(data_dir / "a.txt"));
    EXPECT_TRUE(fs::exists(data_dir / "b.txt"));
    EXPECT_EQ(filesIn(holding_dir), 0u);
}

/**
 * @test DryRunMoveAdvancesToTheEnd
 * @brief A confirmed dry-run move retires the group: it is shown once, the
 *        session ends and the cleanup reports that nothing moved
 */
TEST_F(ApplicationTest, DryRunMoveAdvancesToTheEnd) {
    createDuplicates(2);

    EXPECT_EQ(run(options({"--dry-run"}), "m\n\ny\n"), Application::EXIT_OK);

    EXPECT_EQ(view.groupsShown, 1);
    const std::string text = out.str();
    EXPECT_TRUE(contains(text, "No more duplicate groups found."));
    EXPECT_TRUE(contains(text, "Would move 1 files"));
    EXPECT_TRUE(contains(text, "DRY RUN - No files were actually moved"));
    EXPECT_TRUE(contains(view.out.str(), "planned 1"));
    EXPECT_TRUE(fs::exists(data_dir / "a.txt"));
    EXPECT_TRUE(fs::exists(data_dir / "b.txt"));
    EXPECT_FALSE(fs::exists(holding_dir));
}

TEST_F(ApplicationTest, DryRunDeleteAdvancesToTheEnd) {
    createDuplicates(2);

    EXPECT_EQ(run(options({"--dry-run"}), "d\n\ny\n"), Application::EXIT_OK);

    EXPECT_EQ(view.groupsShown, 1);
    EXPECT_TRUE(contains(out.str(), "Would delete 1 files"));
    EXPECT_TRUE(fs::exists(data_dir / "a.txt"));
}

/**
 * @test MovesSelectedFiles
 * @brief Only the chosen member moves; the rest of the group comes back and
 *        is kept, and the holding directory survives a declined cleanup
 */
TEST_F(ApplicationTest, MovesSelectedFiles) {
    createDuplicates(3);

    EXPECT_EQ(run(options(), "m\n1\ny\nk\nn\n"), Application::EXIT_OK);

    EXPECT_EQ(view.groupsShown, 2);
    EXPECT_FALSE(fs::exists(data_dir / "a.txt"));
    EXPECT_TRUE(fs::exists(data_dir / "b.txt"));
    EXPECT_TRUE(fs::exists(data_dir / "c.txt"));
    EXPECT_EQ(filesIn(holding_dir), 1u);

    const std::string text = out.str();
    EXPECT_TRUE(contains(text, "Moved 1 files to 1 directories:"));
    EXPECT_TRUE(contains(text, "  a.txt\n"));
}

TEST_F(ApplicationTest, InvalidSelectionReturnsToTheGroup) {
    createDuplicates(2);

    EXPECT_EQ(run(options(), "m\n7\nq\n"), Application::EXIT_OK);

    EXPECT_TRUE(contains(out.str(), "Invalid selection: 7"));
    EXPECT_EQ(view.groupsShown, 2);
    EXPECT_TRUE(fs::exists(data_dir / "a.txt"));
}

TEST_F(ApplicationTest, CleanupDeletesHoldingDirectory) {
    createDuplicates(2);

    EXPECT_EQ(run(options(), "m\n\ny\ny\n"), Application::EXIT_OK);

    EXPECT_TRUE(contains(out.str(), "Deleted holding directory"));
    EXPECT_FALSE(fs::exists(holding_dir));
    EXPECT_FALSE(fs::exists(data_dir / "a.txt"));
    EXPECT_TRUE(fs::exists(data_dir / "b.txt"));
}

TEST_F(ApplicationTest, DeletesSelectedFile) {
    createDuplicates(3);

    EXPECT_EQ(run(options(), "d\n2\ny\nq\n"), Application::EXIT_OK);

    EXPECT_TRUE(fs::exists(data_dir / "a.txt"));
    EXPECT_FALSE(fs::exists(data_dir / "b.txt"));
    EXPECT_TRUE(fs::exists(data_dir / "c.txt"));
}

TEST_F(ApplicationTest, KeeperChoiceAndEndOfInput) {
    createDuplicates(2);

    // choose a.txt as keeper, then input ends
    EXPECT_EQ(run(options(), "1\n"), Application::EXIT_OK);

    const std::string panels = view.out.str();
    EXPECT_TRUE(contains(panels, ": a.txt b.txt keeper"));
    EXPECT_TRUE(contains(panels, "keeper " + (data_dir / "b.txt").string()));
    EXPECT_TRUE(contains(panels, "keeper " + (data_dir / "a.txt").string()));
    EXPECT_TRUE(fs::exists(data_dir / "a.txt"));
    EXPECT_TRUE(fs::exists(data_dir / "b.txt"));
}

TEST_F(ApplicationTest, QuitStillRunsCleanup) {
    createDuplicates(3);

    EXPECT_EQ(run(options(), "m\n1\ny\nq\nn\n"), Application::EXIT_OK);

    const std::string text = out.str();
    EXPECT_FALSE(contains(text, "No more duplicate groups found."));
    EXPECT_TRUE(contains(text, "Moved 1 files to 1 directories:"));
    EXPECT_EQ(filesIn(holding_dir), 1u);
}
