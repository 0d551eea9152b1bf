#include <gtest/gtest.h>
#include "sidecar/process_locator.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

class ProcessLocatorTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() / ("stocksbot-locator-" + std::to_string(::getpid()));
        fs::create_directories(root / "app");
        fs::create_directories(root / "resources");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void touch(const fs::path& p) {
        fs::create_directories(p.parent_path());
        std::ofstream(p) << "#\n";
    }

    LocatorPaths paths() const {
        LocatorPaths p;
        p.cwd = (root / "app").string();
        p.resource_dir = (root / "resources").string();
        return p;
    }
};

TEST_F(ProcessLocatorTest, CandidateOrder) {
    ProcessLocator locator(paths());
    auto c = locator.candidates();
    ASSERT_EQ(c.size(), 8u);

    EXPECT_EQ(c[0].path, (root / "backend/dist/stocksbot-backend").string());
    EXPECT_EQ(c[1].path, (root / "app/backend/dist/stocksbot-backend").string());
    EXPECT_EQ(c[2].path, (root / "resources/stocksbot-backend").string());
    EXPECT_EQ(c[3].path, (root / "resources/backend/stocksbot-backend").string());
    for (int i = 0; i < 4; ++i) EXPECT_EQ(c[i].kind, CandidateKind::Binary);

    EXPECT_EQ(c[4].path, (root / "backend/app.py").string());
    EXPECT_EQ(c[5].path, (root / "app/backend/app.py").string());
    EXPECT_EQ(c[6].path, (root / "resources/backend/app.py").string());
    EXPECT_EQ(c[7].path, (root / "resources/app.py").string());
    for (int i = 4; i < 8; ++i) EXPECT_EQ(c[i].kind, CandidateKind::Script);
}

TEST_F(ProcessLocatorTest, NothingOnDisk) {
    ProcessLocator locator(paths());
    EXPECT_FALSE(locator.find_first().has_value());
    EXPECT_TRUE(locator.find_all().empty());
}

TEST_F(ProcessLocatorTest, BinaryPreferredOverScript) {
    touch(root / "backend/app.py");
    touch(root / "resources/stocksbot-backend");

    ProcessLocator locator(paths());
    auto found = locator.find_first();
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->kind, CandidateKind::Binary);
    EXPECT_EQ(found->path, (root / "resources/stocksbot-backend").string());

    auto all = locator.find_all();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[1].kind, CandidateKind::Script);
}

TEST_F(ProcessLocatorTest, ScriptFoundNextToWorkingDir) {
    touch(root / "app/backend/app.py");

    ProcessLocator locator(paths());
    auto found = locator.find_first();
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->kind, CandidateKind::Script);
    EXPECT_EQ(found->path, (root / "app/backend/app.py").string());
}

TEST_F(ProcessLocatorTest, DirectoryIsNotACandidate) {
    fs::create_directories(root / "resources/stocksbot-backend");

    ProcessLocator locator(paths());
    EXPECT_FALSE(locator.find_first().has_value());
}

TEST_F(ProcessLocatorTest, EmptyRootsAreSkipped) {
    LocatorPaths p;
    p.cwd = (root / "app").string();
    ProcessLocator locator(p);
    EXPECT_EQ(locator.candidates().size(), 4u);
}

TEST_F(ProcessLocatorTest, CustomNames) {
    LocatorPaths p = paths();
    p.binary_name = "api-server";
    p.script_name = "main.py";
    touch(root / "resources/backend/main.py");

    ProcessLocator locator(p);
    auto found = locator.find_first();
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->path, (root / "resources/backend/main.py").string());
}

TEST(ProcessLocatorSuffix, NoSuffixOnPosix) {
    EXPECT_STREQ(ProcessLocator::executable_suffix(), "");
}
