// VEIL - Configuration Tests
// Copyright (c) 2024 VEIL Developers
// MIT License

#include <gtest/gtest.h>

#include "veil/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace veil {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/veil_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseComments) {
    auto result = config_.ParseString("# comment\n; another\n\n");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePair) {
    ASSERT_TRUE(config_.ParseString("  seed = veil-test  ").success);
    EXPECT_EQ(config_.GetString("seed", ""), "veil-test");
}

TEST_F(ConfigTest, ParseQuotedValueWithEscapes) {
    ASSERT_TRUE(config_.ParseString("msg=\"line1\\nline2\"\nraw='a\\nb'").success);
    EXPECT_EQ(config_.GetString("msg", ""), "line1\nline2");
    EXPECT_EQ(config_.GetString("raw", ""), "a\\nb");
}

TEST_F(ConfigTest, ParseBareKeyIsFlag) {
    ASSERT_TRUE(config_.ParseString("verbose").success);
    EXPECT_TRUE(config_.GetBool("verbose", false));
}

TEST_F(ConfigTest, ParseSection) {
    std::string content =
        "[puzzle]\n"
        "degree=64\n"
        "seed=abc\n"
        "[storage]\n"
        "backend=db\n";
    ASSERT_TRUE(config_.ParseString(content).success);

    EXPECT_EQ(config_.GetUInt(ConfigKeys::DEGREE, 0, ConfigKeys::SECTION_PUZZLE), 64u);
    EXPECT_EQ(config_.GetString(ConfigKeys::BACKEND, "", ConfigKeys::SECTION_STORAGE), "db");
    EXPECT_FALSE(config_.HasKey(ConfigKeys::DEGREE));

    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0], "puzzle");
    EXPECT_EQ(sections[1], "storage");
}

TEST_F(ConfigTest, MissingSectionBracketFails) {
    auto result = config_.ParseString("ok=1\n[broken\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorSource, "test.conf");
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, InvalidKeyCharacterFails) {
    EXPECT_FALSE(config_.ParseString("bad key=1").success);
}

// ============================================================================
// Typed Access Tests
// ============================================================================

TEST_F(ConfigTest, GetInt) {
    ASSERT_TRUE(config_.ParseString("a=-12\nb=0x10\nc=12abc").success);
    EXPECT_EQ(config_.GetInt("a", 0), -12);
    EXPECT_EQ(config_.GetInt("b", 0), 16);
    EXPECT_EQ(config_.GetInt("c", 7), 7);
    EXPECT_EQ(config_.GetInt("missing", 99), 99);
}

TEST_F(ConfigTest, GetUIntRejectsNegative) {
    ASSERT_TRUE(config_.ParseString("threads=-1\nnonce_count=18446744073709551615").success);
    EXPECT_EQ(config_.GetUInt("threads", 4), 4u);
    EXPECT_EQ(config_.GetUInt("nonce_count", 0), UINT64_MAX);
}

TEST_F(ConfigTest, GetBool) {
    ASSERT_TRUE(config_.ParseString("a=yes\nb=OFF\nc=maybe").success);
    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_TRUE(config_.GetBool("c", true));
    EXPECT_FALSE(config_.TryGetBool("c").has_value());
}

// ============================================================================
// Expansion Tests
// ============================================================================

TEST_F(ConfigTest, ExpandEnvVarsBraced) {
    setenv("VEIL_TEST_VAR", "test_value", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("prefix_${VEIL_TEST_VAR}_suffix"), "prefix_test_value_suffix");
    unsetenv("VEIL_TEST_VAR");
}

TEST_F(ConfigTest, ExpandEnvVarsUndefinedIsEmpty) {
    unsetenv("VEIL_UNDEFINED_VAR");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("a${VEIL_UNDEFINED_VAR}b"), "ab");
}

TEST_F(ConfigTest, ExpandTilde) {
    setenv("HOME", "/home/veil", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/.veil"), "/home/veil/.veil");
    EXPECT_EQ(ConfigManager::ExpandTilde("~"), "/home/veil");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/x"), "~other/x");
    EXPECT_EQ(ConfigManager::ExpandTilde("/a/~/b"), "/a/~/b");
}

TEST_F(ConfigTest, GetPathExpandsTilde) {
    setenv("HOME", "/home/veil", 1);
    ASSERT_TRUE(config_.ParseString("[storage]\ndatadir=~/data").success);
    EXPECT_EQ(config_.GetPath(ConfigKeys::DATADIR, "", ConfigKeys::SECTION_STORAGE), "/home/veil/data");
}

// ============================================================================
// File and Command-Line Tests
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("[log]\nlevel=debug\n");
    ASSERT_TRUE(config_.ParseFile(path).success);
    EXPECT_EQ(config_.GetString(ConfigKeys::LEVEL, "", ConfigKeys::SECTION_LOG), "debug");
}

TEST_F(ConfigTest, ParseNonexistentFile) {
    auto result = config_.ParseFile("/nonexistent/veil.conf");
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.errorMessage.empty());
}

TEST_F(ConfigTest, ParseCommandLineSectionKeys) {
    const char* argv[] = {"veil-puzzle", "-puzzle.degree=32", "--puzzle.epoch", "5", "-verbose", "stray"};
    ASSERT_TRUE(config_.ParseCommandLine(6, argv).success);
    EXPECT_EQ(config_.GetUInt(ConfigKeys::DEGREE, 0, ConfigKeys::SECTION_PUZZLE), 32u);
    EXPECT_EQ(config_.GetUInt(ConfigKeys::EPOCH, 0, ConfigKeys::SECTION_PUZZLE), 5u);
    EXPECT_TRUE(config_.GetBool("verbose", false));
    EXPECT_FALSE(config_.HasKey("stray"));
}

TEST_F(ConfigTest, ParseCommandLineEmptyKeyFails) {
    const char* argv[] = {"veil-puzzle", "-puzzle.=1"};
    EXPECT_FALSE(config_.ParseCommandLine(2, argv).success);
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
    std::string path = CreateTempFile("[puzzle]\ndegree=16\nseed=file\n");
    ASSERT_TRUE(config_.ParseFile(path).success);

    const char* argv[] = {"veil-puzzle", "-puzzle.degree=64"};
    ASSERT_TRUE(config_.ParseCommandLine(2, argv).success);

    EXPECT_EQ(config_.GetUInt(ConfigKeys::DEGREE, 0, ConfigKeys::SECTION_PUZZLE), 64u);
    EXPECT_EQ(config_.GetString(ConfigKeys::SEED, "", ConfigKeys::SECTION_PUZZLE), "file");
}

// ============================================================================
// Mutation Tests
// ============================================================================

TEST_F(ConfigTest, SetOverwritesAndClear) {
    config_.Set("key", "one");
    config_.Set("key", "two");
    config_.Set("key", "three", "section");
    EXPECT_EQ(config_.GetString("key", ""), "two");
    EXPECT_EQ(config_.GetString("key", "", "section"), "three");
    EXPECT_EQ(config_.Size(), 2u);

    config_.Clear();
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, DumpListsSections) {
    config_.Set("global", "1");
    config_.Set("degree", "8", "puzzle");
    std::string dump = config_.Dump();
    EXPECT_NE(dump.find("global=1"), std::string::npos);
    EXPECT_NE(dump.find("[puzzle]\ndegree=8"), std::string::npos);
}

} // namespace test
} // namespace util
} // namespace veil
