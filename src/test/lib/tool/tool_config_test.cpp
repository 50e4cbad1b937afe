#include "tool/tool_config.hpp"

#include <array>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "utils/assert.hpp"

namespace stratus {

class ToolConfigTest : public ::testing::Test {
 protected:
  template <size_t N>
  static cxxopts::ParseResult Parse(const std::array<const char*, N>& arguments) {
    cxxopts::Options options = ConfigureCliOptions();
    return options.parse(static_cast<int>(N), arguments.data());
  }
};

TEST_F(ToolConfigTest, ToolOptionToEnumValidInputFormat) {
  const std::string valid_format_enum_exist = "function-deploy";
  EXPECT_EQ(ToolType::kFunctionDeploy, ToolOptionToEnum(valid_format_enum_exist));
}

TEST_F(ToolConfigTest, ToolOptionToEnumInvalidInputFormat) {
  const std::string invalid_format = "deploy";
  EXPECT_THROW(
      try { ToolOptionToEnum(invalid_format); } catch (const InvalidInputException& exception) {
        EXPECT_THAT(exception.what(), testing::HasSubstr("Tool must be specified in format 'tool-identifier'."));
        throw;
      },
      InvalidInputException);
}

TEST_F(ToolConfigTest, ToolOptionToEnumValidInputFormatButNotFound) {
  const std::string valid_format_enum_not_exist = "function-upload";
  EXPECT_THROW(ToolOptionToEnum(valid_format_enum_not_exist), std::bad_optional_access);
}

TEST_F(ToolConfigTest, ConfigureCliOptions) {
  const cxxopts::Options options = ConfigureCliOptions();
  EXPECT_EQ(options.program(), kProgramName);
  EXPECT_EQ(options.groups().size(), 4);
  EXPECT_EQ(options.groups()[1], "tool");
  EXPECT_EQ(options.groups()[2], "logging");
  EXPECT_EQ(options.groups()[3], "function-deploy");
}

TEST_F(ToolConfigTest, LogLevelDefaultsToWarn) {
  const std::array<const char*, 1> arguments = {"./stratus"};
  EXPECT_EQ(LogLevelFromCliOptions(Parse(arguments)), Aws::Utils::Logging::LogLevel::Warn);
}

TEST_F(ToolConfigTest, LogLevelFromVerboseAndExplicitLevel) {
  const std::array<const char*, 2> verbose_arguments = {"./stratus", "-v"};
  EXPECT_EQ(LogLevelFromCliOptions(Parse(verbose_arguments)), Aws::Utils::Logging::LogLevel::Info);

  const std::array<const char*, 4> explicit_arguments = {"./stratus", "-v", "--log_level", "DEBUG"};
  EXPECT_EQ(LogLevelFromCliOptions(Parse(explicit_arguments)), Aws::Utils::Logging::LogLevel::Debug);
}

TEST_F(ToolConfigTest, LogLevelRejectsUnknownLevel) {
  const std::array<const char*, 3> arguments = {"./stratus", "--log_level", "chatty"};
  EXPECT_THROW(LogLevelFromCliOptions(Parse(arguments)), InvalidInputException);
}

}  // namespace stratus
