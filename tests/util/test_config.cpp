// QUORUM - Configuration File Parser Tests
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include <gtest/gtest.h>

#include "quorum/util/config.h"
#include "quorum/governance/governance.h"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace quorum {
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
        char filename[] = "/tmp/quorum_config_test_XXXXXX";
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
    std::string content = R"(
# This is a comment
; This is also a comment
# key=value
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePair) {
    auto result = config_.ParseString("  key =  value  ");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(config_.HasKey("key"));
    EXPECT_EQ(config_.GetString("key", ""), "value");
}

TEST_F(ConfigTest, QuotedValues) {
    std::string content = R"(
double="hello world"
single='raw\n'
escaped="line\tone"
)";
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_EQ(config_.GetString("double", ""), "hello world");
    EXPECT_EQ(config_.GetString("single", ""), "raw\\n");
    EXPECT_EQ(config_.GetString("escaped", ""), "line\tone");
}

TEST_F(ConfigTest, BareFlags) {
    ASSERT_TRUE(config_.ParseString("printtoconsole\nnodebug\n").success);
    EXPECT_TRUE(config_.GetBool("printtoconsole", false));
    EXPECT_FALSE(config_.GetBool("debug", true));
}

TEST_F(ConfigTest, LineContinuation) {
    ASSERT_TRUE(config_.ParseString("list=a,\\\nb,c\n").success);
    EXPECT_EQ(config_.GetList("list"), (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(ConfigTest, InvalidLinesReportLocation) {
    auto result = config_.ParseString("ok=1\nbad key=2\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "test.conf");
    EXPECT_EQ(result.errorLine, 2);

    config_.Clear();
    result = config_.ParseString("[governance\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);

    config_.Clear();
    EXPECT_FALSE(config_.ParseString("=value\n").success);
}

TEST_F(ConfigTest, LineTooLong) {
    std::string content = "key=" + std::string(MAX_LINE_LENGTH + 1, 'x');
    EXPECT_FALSE(config_.ParseString(content).success);
}

// ============================================================================
// Section Tests
// ============================================================================

TEST_F(ConfigTest, SectionsScopeKeys) {
    std::string content = R"(
name=global
[governance]
name=Governor
votingperiod=10
[logging]
loglevel=debug
)";
    ASSERT_TRUE(config_.ParseString(content).success);

    EXPECT_EQ(config_.GetString("name", ""), "global");
    EXPECT_EQ(config_.GetString("name", "", "governance"), "Governor");
    EXPECT_FALSE(config_.HasKey("votingperiod"));
    EXPECT_TRUE(config_.HasKey("votingperiod", "governance"));

    EXPECT_EQ(config_.GetSections(), (std::vector<std::string>{"governance", "logging"}));
    EXPECT_EQ(config_.GetKeys("governance"),
              (std::vector<std::string>{"name", "votingperiod"}));
}

// ============================================================================
// Typed Getter Tests
// ============================================================================

TEST_F(ConfigTest, IntegerValues) {
    std::string content = R"(
positive=42
negative=-7
garbage=12abc
)";
    ASSERT_TRUE(config_.ParseString(content).success);

    EXPECT_EQ(config_.GetInt("positive", 0), 42);
    EXPECT_EQ(config_.GetInt("negative", 0), -7);
    EXPECT_FALSE(config_.TryGetInt("garbage").has_value());
    EXPECT_EQ(config_.GetInt("missing", 99), 99);
}

TEST_F(ConfigTest, UnsignedCoversFullRange) {
    std::string content = R"(
max=18446744073709551615
over=18446744073709551616
negative=-1
)";
    ASSERT_TRUE(config_.ParseString(content).success);

    auto max = config_.TryGetUInt("max");
    ASSERT_TRUE(max.has_value());
    EXPECT_EQ(*max, std::numeric_limits<uint64_t>::max());
    EXPECT_FALSE(config_.TryGetUInt("over").has_value());
    EXPECT_FALSE(config_.TryGetUInt("negative").has_value());
    EXPECT_EQ(config_.GetUInt("missing", 5), 5u);
}

TEST_F(ConfigTest, BooleanValues) {
    std::string content = R"(
a=yes
b=OFF
c=1
d=maybe
)";
    ASSERT_TRUE(config_.ParseString(content).success);

    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_TRUE(config_.GetBool("c", false));
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
    EXPECT_TRUE(config_.GetBool("d", true));
}

TEST_F(ConfigTest, RepeatedKeysAccumulateIntoList) {
    std::string content = R"(
debug=governance,voting
debug=execution
)";
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_EQ(config_.GetList("debug"),
              (std::vector<std::string>{"governance", "voting", "execution"}));
    // Scalar lookups see the first value
    EXPECT_EQ(config_.GetString("debug", ""), "governance,voting");
}

TEST_F(ConfigTest, SetReplacesListAndDefaultsYield) {
    ASSERT_TRUE(config_.ParseString("peer=a\npeer=b\n").success);
    config_.Set("peer", "c");
    EXPECT_EQ(config_.GetList("peer"), (std::vector<std::string>{"c"}));

    config_.SetDefault("peer", "ignored");
    EXPECT_EQ(config_.GetString("peer", ""), "c");

    config_.SetDefault("fresh", "default");
    EXPECT_EQ(config_.GetString("fresh", ""), "default");
    ASSERT_TRUE(config_.ParseString("fresh=parsed\n").success);
    EXPECT_EQ(config_.GetString("fresh", ""), "parsed");
}

// ============================================================================
// Expansion Tests
// ============================================================================

TEST_F(ConfigTest, EnvironmentVariablesExpand) {
    setenv("QUORUM_TEST_VAR", "expanded", 1);
    ASSERT_TRUE(config_.ParseString("a=${QUORUM_TEST_VAR}/x\nb=$QUORUM_TEST_VAR-y\n").success);
    EXPECT_EQ(config_.GetString("a", ""), "expanded/x");
    EXPECT_EQ(config_.GetString("b", ""), "expanded-y");
    unsetenv("QUORUM_TEST_VAR");

    EXPECT_EQ(ConfigManager::ExpandEnvVars("${QUORUM_UNSET_VAR_XYZ}"), "");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("a $ b"), "a $ b");
}

TEST_F(ConfigTest, TildeExpandsOnlyAtStart) {
    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/quorum.log"), "/home/tester/quorum.log");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/file"), "~other/file");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs/~"), "/abs/~");

    config_.Set("logfile", "~/q.log");
    EXPECT_EQ(config_.GetPath("logfile"), "/home/tester/q.log");
}

// ============================================================================
// File Tests
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("[governance]\nquorumvotes=400\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetUInt("quorumvotes", 0, "governance"), 400u);
}

TEST_F(ConfigTest, ParseMissingFile) {
    auto result = config_.ParseFile("/nonexistent/quorum.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("cannot open /nonexistent/quorum.conf"), std::string::npos);
}

TEST_F(ConfigTest, IncludeDirective) {
    std::string inner = CreateTempFile("included=yes\n");
    std::string outer = CreateTempFile("include " + inner + "\nouter=1\n");

    ASSERT_TRUE(config_.ParseFile(outer).success);
    EXPECT_TRUE(config_.GetBool("included", false));
    EXPECT_EQ(config_.GetInt("outer", 0), 1);
}

TEST_F(ConfigTest, SelfIncludeHitsDepthLimit) {
    std::string path = CreateTempFile("");
    {
        std::ofstream file(path);
        file << "include " << path << "\n";
    }
    auto result = config_.ParseFile(path);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("include depth"), std::string::npos);
}

// ============================================================================
// Command Line Tests
// ============================================================================

TEST_F(ConfigTest, CommandLineOverridesFile) {
    ASSERT_TRUE(config_.ParseString("[logging]\nloglevel=info\n").success);

    const char* argv[] = {"quorum", "--logging.loglevel=debug", "-governance.votingperiod",
                          "25", "-noprinttoconsole", "positional", "-verbose"};
    auto result = config_.ParseCommandLine(7, argv);
    ASSERT_TRUE(result.success);

    EXPECT_EQ(config_.GetString("loglevel", "", "logging"), "debug");
    EXPECT_EQ(config_.GetUInt("votingperiod", 0, "governance"), 25u);
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
    EXPECT_TRUE(config_.GetBool("verbose", false));
    EXPECT_FALSE(config_.HasKey("positional"));
}

TEST_F(ConfigTest, CommandLineRejectsBadKey) {
    const char* argv[] = {"quorum", "-bad$key=1"};
    auto result = config_.ParseCommandLine(2, argv);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("-bad$key=1"), std::string::npos);
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(ConfigTest, RequiredKeys) {
    config_.RequireKey("quorumvotes", "governance");
    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("[governance] quorumvotes"), std::string::npos);

    config_.Set("quorumvotes", "10", "governance");
    EXPECT_TRUE(config_.Validate().empty());
}

TEST_F(ConfigTest, DumpShowsSources) {
    ASSERT_TRUE(config_.ParseString("[governance]\nname=Governor\n", "gov.conf").success);
    config_.SetDefault("loglevel", "info", "logging");

    std::string dump = config_.Dump();
    EXPECT_NE(dump.find("[governance]"), std::string::npos);
    EXPECT_NE(dump.find("name=Governor  # gov.conf:2"), std::string::npos);
    EXPECT_NE(dump.find("loglevel=info  # (default)"), std::string::npos);
}

TEST_F(ConfigTest, SampleConfigLoadsAsGovernanceConfig) {
    auto result = config_.ParseString(ConfigManager::GenerateSampleConfig());
    ASSERT_TRUE(result.success) << result.errorMessage;

    governance::GovernanceConfig gov = governance::GovernanceConfig::FromConfig(config_);
    EXPECT_EQ(gov.name, "Governor");
    EXPECT_EQ(gov.quorumVotes, 400000u);
    EXPECT_EQ(gov.proposalThreshold, 100000u);
    EXPECT_EQ(gov.proposalMaxOperations, 10u);
    EXPECT_EQ(gov.votingPeriod, 17280u);
    EXPECT_EQ(gov.proposalLifetime, 40320u);
    EXPECT_EQ(gov.chainId, 1u);
    EXPECT_TRUE(gov.contract.IsNull());
    EXPECT_NO_THROW(gov.Validate(10000000));
}

} // namespace test
} // namespace util
} // namespace quorum
