#include <gtest/gtest.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>

#include <nlohmann/json.hpp>

#include "ulidkit/cli/application.hpp"
#include "temp_directory.hpp"

namespace ulidkit::cli {

struct CommandOutput {
  int exit_code = 0;
  std::string out;
  std::string err;
};

class CliTest : public ::testing::Test {
protected:
  void SetUp() override {
    temp_dir_ = std::make_unique<ulidkit::test::TempDirectory>();

    // Keep the user's own config and log files out of the picture
    setenv("XDG_CONFIG_HOME", (temp_dir_->path() / "config").c_str(), 1);
    setenv("XDG_STATE_HOME", (temp_dir_->path() / "state").c_str(), 1);
  }

  void TearDown() override {
    unsetenv("XDG_CONFIG_HOME");
    unsetenv("XDG_STATE_HOME");
    temp_dir_.reset();
  }

  // Run one command line through a fresh Application, capturing both streams
  CommandOutput runCommand(const std::vector<std::string>& args, const std::string& stdin_text = "") {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>("ulidkit"));
    for (const auto& arg : args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }

    std::istringstream cin_input(stdin_text);
    std::ostringstream cout_output, cerr_output;
    std::streambuf* orig_cin = std::cin.rdbuf();
    std::streambuf* orig_cout = std::cout.rdbuf();
    std::streambuf* orig_cerr = std::cerr.rdbuf();
    std::cin.rdbuf(cin_input.rdbuf());
    std::cout.rdbuf(cout_output.rdbuf());
    std::cerr.rdbuf(cerr_output.rdbuf());

    CommandOutput output;
    try {
      Application app;
      output.exit_code = app.run(static_cast<int>(argv.size()), argv.data());
    } catch (const std::exception&) {
      std::cin.rdbuf(orig_cin);
      std::cout.rdbuf(orig_cout);
      std::cerr.rdbuf(orig_cerr);
      throw;
    }

    std::cin.rdbuf(orig_cin);
    std::cout.rdbuf(orig_cout);
    std::cerr.rdbuf(orig_cerr);

    output.out = cout_output.str();
    output.err = cerr_output.str();
    return output;
  }

  std::unique_ptr<ulidkit::test::TempDirectory> temp_dir_;
};

TEST_F(CliTest, InspectText) {
  auto result = runCommand({"inspect", "01ARYZ6S4104HMASW9NF6YY093"});
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.out.find("ULID:      01ARYZ6S4104HMASW9NF6YY093"), std::string::npos);
  EXPECT_NE(result.out.find("Timestamp: 1469918176385 (2016-07-30T22:36:16.385Z)"),
            std::string::npos);
  EXPECT_NE(result.out.find("Random:    0x0123456789abcdef0123"), std::string::npos);
  EXPECT_NE(result.out.find("Nil:       no"), std::string::npos);
  EXPECT_EQ(result.out.find("Canonical"), std::string::npos);
}

TEST_F(CliTest, InspectLargestTimestamp) {
  auto result = runCommand({"inspect", "7ZZZZZZZZZZZZZZZZZZZZZZZZZ"});
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.out.find("Timestamp: 281474976710655 (+10889-08-02T05:31:50.655Z)"),
            std::string::npos);

  auto json_result = runCommand({"--json", "inspect", "7ZZZZZZZZZZZZZZZZZZZZZZZZZ"});
  ASSERT_EQ(json_result.exit_code, 0);
  auto json = nlohmann::json::parse(json_result.out);
  EXPECT_EQ(json["timestamp_ms"], 281474976710655ULL);
  EXPECT_EQ(json["timestamp"], "+10889-08-02T05:31:50.655Z");
}

TEST_F(CliTest, InspectLowercaseAndQuiet) {
  auto result = runCommand({"-q", "inspect", "01aryz6s4104hmasw9nf6yy093"});
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.out, "01ARYZ6S4104HMASW9NF6YY093\n");
}

TEST_F(CliTest, InspectJson) {
  auto result = runCommand({"--json", "inspect", "01ARYZ6S4104HMASW9NF6YY093"});
  ASSERT_EQ(result.exit_code, 0);

  auto json = nlohmann::json::parse(result.out);
  EXPECT_EQ(json["ulid"], "01ARYZ6S4104HMASW9NF6YY093");
  EXPECT_EQ(json["timestamp_ms"], 1469918176385ULL);
  EXPECT_EQ(json["timestamp"], "2016-07-30T22:36:16.385Z");
  EXPECT_EQ(json["random"], "0x0123456789abcdef0123");
  EXPECT_EQ(json["nil"], false);
  EXPECT_EQ(json["canonical_input"], true);
}

TEST_F(CliTest, InspectHexInput) {
  auto result = runCommand({"--json", "inspect", "--hex", "0x0"});
  ASSERT_EQ(result.exit_code, 0);

  auto json = nlohmann::json::parse(result.out);
  EXPECT_EQ(json["ulid"], "00000000000000000000000000");
  EXPECT_EQ(json["nil"], true);
  EXPECT_EQ(json["bytes"], "00000000000000000000000000000000");
}

TEST_F(CliTest, InspectNonCanonicalInput) {
  auto result = runCommand({"inspect", "8ZZZZZZZZZZZZZZZZZZZZZZZZZ"});
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.out.find("ULID:      0ZZZZZZZZZZZZZZZZZZZZZZZZZ"), std::string::npos);
  EXPECT_NE(result.out.find("Canonical: no"), std::string::npos);
}

TEST_F(CliTest, InspectInvalid) {
  auto result = runCommand({"inspect", "not-a-ulid"});
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.err.find("Error: Invalid ULID 'not-a-ulid': invalid length"), std::string::npos);

  auto bad_char = runCommand({"inspect", "01ARYZ6S4104HMASW9NF6YY09U"});
  EXPECT_EQ(bad_char.exit_code, 1);
  EXPECT_NE(bad_char.err.find("invalid character"), std::string::npos);
}

TEST_F(CliTest, ErrorAsJson) {
  auto result = runCommand({"--json", "inspect", "short"});
  EXPECT_EQ(result.exit_code, 1);

  auto json = nlohmann::json::parse(result.out);
  EXPECT_EQ(json["kind"], "Parse error");
  EXPECT_EQ(json["error"], "Invalid ULID 'short': invalid length");
}

TEST_F(CliTest, ComposeFromMilliseconds) {
  auto result = runCommand(
      {"compose", "--time-ms", "1469918176385", "--random", "0x0123456789abcdef0123"});
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.out, "01ARYZ6S4104HMASW9NF6YY093\n");
}

TEST_F(CliTest, ComposeFromRfc3339) {
  auto result = runCommand(
      {"compose", "--time", "2016-07-30T22:36:16.385Z", "--random", "0123456789abcdef0123"});
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.out, "01ARYZ6S4104HMASW9NF6YY093\n");
}

TEST_F(CliTest, ComposeJsonWithDefaultRandom) {
  auto result = runCommand({"--json", "compose", "--time-ms", "1"});
  ASSERT_EQ(result.exit_code, 0);

  auto json = nlohmann::json::parse(result.out);
  EXPECT_EQ(json["ulid"], "0000000001" + std::string(16, '0'));
  EXPECT_EQ(json["timestamp_ms"], 1);
  EXPECT_EQ(json["random"], "0x00000000000000000000");
}

TEST_F(CliTest, ComposeRequiresTime) {
  auto result = runCommand({"compose", "--random", "0x1"});
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.err.find("--time-ms or --time"), std::string::npos);
}

TEST_F(CliTest, ComposeRejectsBothTimes) {
  auto result = runCommand({"compose", "--time-ms", "1", "--time", "2024-01-01T00:00:00Z"});
  EXPECT_NE(result.exit_code, 0);
}

TEST_F(CliTest, ComposeRejectsBadHex) {
  auto result = runCommand({"compose", "--time-ms", "1", "--random", "xyz"});
  EXPECT_EQ(result.exit_code, 1);
}

TEST_F(CliTest, IncrementCarries) {
  auto result = runCommand({"increment", "01BX5ZZKBKACTAV9WEVGEMMVRY", "-n", "2"});
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.out, "01BX5ZZKBKACTAV9WEVGEMMVRZ\n01BX5ZZKBKACTAV9WEVGEMMVS0\n");
}

TEST_F(CliTest, IncrementJson) {
  auto result = runCommand({"--json", "increment", "01BX5ZZKBKACTAV9WEVGEMMVRY"});
  ASSERT_EQ(result.exit_code, 0);

  auto json = nlohmann::json::parse(result.out);
  ASSERT_TRUE(json.is_array());
  ASSERT_EQ(json.size(), 1u);
  EXPECT_EQ(json[0], "01BX5ZZKBKACTAV9WEVGEMMVRZ");
}

TEST_F(CliTest, IncrementExhausted) {
  auto result = runCommand({"increment", "01BX5ZZKBKZZZZZZZZZZZZZZZY", "-n", "3"});
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.err.find("Random field of 01BX5ZZKBKZZZZZZZZZZZZZZZZ is exhausted after 1"),
            std::string::npos);
}

TEST_F(CliTest, IncrementCountOutOfRange) {
  auto zero = runCommand({"increment", "01BX5ZZKBKACTAV9WEVGEMMVRY", "-n", "0"});
  EXPECT_EQ(zero.exit_code, 1);
  EXPECT_NE(zero.err.find("Count must be between 1 and 1000000"), std::string::npos);

  auto huge = runCommand({"increment", "01BX5ZZKBKACTAV9WEVGEMMVRY", "-n", "18446744073709551615"});
  EXPECT_EQ(huge.exit_code, 1);
  EXPECT_NE(huge.err.find("Count must be between 1 and 1000000"), std::string::npos);
  EXPECT_TRUE(huge.out.empty());
}

TEST_F(CliTest, ValidateMixed) {
  auto result = runCommand({"validate", "01ARYZ6S4104HMASW9NF6YY093", "8ZZZZZZZZZZZZZZZZZZZZZZZZZ"});
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.out.find("01ARYZ6S4104HMASW9NF6YY093: valid\n"), std::string::npos);
  EXPECT_NE(result.out.find("8ZZZZZZZZZZZZZZZZZZZZZZZZZ: valid, non-canonical"), std::string::npos);
}

TEST_F(CliTest, ValidateStrict) {
  auto result = runCommand({"validate", "--strict", "7ZZZZZZZZZZZZZZZZZZZZZZZZZ",
                            "8ZZZZZZZZZZZZZZZZZZZZZZZZZ"});
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.out.find("7ZZZZZZZZZZZZZZZZZZZZZZZZZ: valid\n"), std::string::npos);
  EXPECT_NE(result.out.find("8ZZZZZZZZZZZZZZZZZZZZZZZZZ: invalid (leading character above 7)"),
            std::string::npos);
}

TEST_F(CliTest, ValidateJson) {
  auto result = runCommand({"--json", "validate", "01ARYZ6S4104HMASW9NF6YY093", "01ARYZ"});
  EXPECT_EQ(result.exit_code, 1);

  auto json = nlohmann::json::parse(result.out);
  EXPECT_EQ(json["valid"], false);
  EXPECT_EQ(json["strict"], false);
  ASSERT_EQ(json["results"].size(), 2u);
  EXPECT_EQ(json["results"][0]["valid"], true);
  EXPECT_FALSE(json["results"][0].contains("reason"));
  EXPECT_EQ(json["results"][1]["valid"], false);
  EXPECT_EQ(json["results"][1]["reason"], "invalid length");
}

TEST_F(CliTest, ValidateStrictFromConfig) {
  auto config_path = temp_dir_->writeFile("strict.toml", "[validate]\nstrict_leading_char = true\n");

  auto result = runCommand({"--config", config_path.string(), "validate", "ZZZZZZZZZZZZZZZZZZZZZZZZZZ"});
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.out.find("invalid (leading character above 7)"), std::string::npos);
}

TEST_F(CliTest, JsonOutputFromConfig) {
  auto config_path = temp_dir_->writeFile("json.toml", "[output]\nformat = \"json\"\njson_indent = 0\n");

  auto result = runCommand({"--config", config_path.string(), "compose", "--time-ms", "0"});
  ASSERT_EQ(result.exit_code, 0);
  auto json = nlohmann::json::parse(result.out);
  EXPECT_EQ(json["ulid"], "00000000000000000000000000");
  EXPECT_EQ(json["timestamp_ms"], 0);
}

TEST_F(CliTest, MissingConfigFile) {
  auto result = runCommand({"--config", (temp_dir_->path() / "absent.toml").string(), "inspect",
                            "01ARYZ6S4104HMASW9NF6YY093"});
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.err.find("Config file not found"), std::string::npos);
}

TEST_F(CliTest, SortArguments) {
  auto result = runCommand({"sort", "01BX5ZZKBKACTAV9WEVGEMMVS0", "01ARYZ6S4104HMASW9NF6YY093",
                            "01BX5ZZKBKACTAV9WEVGEMMVRZ"});
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.out,
            "01ARYZ6S4104HMASW9NF6YY093\n"
            "01BX5ZZKBKACTAV9WEVGEMMVRZ\n"
            "01BX5ZZKBKACTAV9WEVGEMMVS0\n");
}

TEST_F(CliTest, SortStdinUniqueReverse) {
  auto result = runCommand({"sort", "-u", "-r"},
                           "01ARYZ6S4104HMASW9NF6YY093\n"
                           "  01bx5zzkbkactav9wevgemmvrz  \n"
                           "\n"
                           "01ARYZ6S4104HMASW9NF6YY093\n");
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.out,
            "01BX5ZZKBKACTAV9WEVGEMMVRZ\n"
            "01ARYZ6S4104HMASW9NF6YY093\n");
}

TEST_F(CliTest, SortRejectsInvalid) {
  auto result = runCommand({"sort", "01ARYZ6S4104HMASW9NF6YY093", "bogus"});
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.err.find("Invalid ULID 'bogus'"), std::string::npos);
}

TEST_F(CliTest, RequiresSubcommand) {
  auto result = runCommand({});
  EXPECT_NE(result.exit_code, 0);
}

}  // namespace ulidkit::cli
