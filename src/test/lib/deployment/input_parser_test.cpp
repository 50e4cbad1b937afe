#include "deployment/input_parser.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "testing/aws_test.hpp"

namespace stratus {

class InputParserTest : public ::testing::Test {
 protected:
  const AwsApi aws_api_;
};

TEST_F(InputParserTest, AbsentOptionsStayUnset) {
  const auto input = ParseDeploymentInput({{kFunctionNameOption, "f1"}, {kCodeArtifactOption, "f1.zip"}});

  EXPECT_EQ(input.identity.name, "f1");
  EXPECT_EQ(input.code_artifact, "f1.zip");
  EXPECT_TRUE(input.config.IsEmpty());
  EXPECT_FALSE(input.image_config.has_value());
  EXPECT_FALSE(input.s3_bucket.has_value());
  EXPECT_EQ(input.publish, kDefaultPublish);
  EXPECT_EQ(input.dry_run, kDefaultDryRun);
  EXPECT_TRUE(input.parse_violations.empty());
}

TEST_F(InputParserTest, DecodesScalarOptions) {
  const auto input = ParseDeploymentInput({{kFunctionNameOption, "f1"},
                                           {kMemorySizeOption, "512"},
                                           {kTimeoutOption, "30"},
                                           {kReservedConcurrencyOption, "0"},
                                           {kPublishOption, "False"},
                                           {kDryRunOption, "false"},
                                           {kRevisionIdOption, "abc"}});

  EXPECT_TRUE(input.parse_violations.empty());
  EXPECT_EQ(input.config.memory_size, 512);
  EXPECT_EQ(input.config.timeout, 30);
  EXPECT_EQ(input.config.reserved_concurrency, 0);
  EXPECT_FALSE(input.publish);
  EXPECT_FALSE(input.dry_run);
  EXPECT_EQ(input.revision_id, "abc");
}

TEST_F(InputParserTest, EmptyEnvironmentIsSetButEmpty) {
  const auto input = ParseDeploymentInput({{kEnvironmentOption, "{}"}});

  ASSERT_TRUE(input.config.environment.has_value());
  EXPECT_TRUE(input.config.environment->empty());
}

TEST_F(InputParserTest, DecodesJsonOptions) {
  const auto input = ParseDeploymentInput(
      {{kEnvironmentOption, R"({"STAGE": "prod"})"},
       {kTagsOption, R"({"team": "data"})"},
       {kLayersOption, R"(["arn:aws:lambda:us-east-1:123456789012:layer:l:1"])"},
       {kVpcConfigOption, R"({"SubnetIds": ["s-1"], "SecurityGroupIds": ["sg-1"], "Ipv6AllowedForDualStack": true})"},
       {kFileSystemConfigsOption, R"([{"Arn": "arn:fs", "LocalMountPath": "/mnt/data"}])"},
       {kSnapStartOption, R"({"ApplyOn": "PublishedVersions"})"},
       {kLoggingConfigOption, R"({"LogFormat": "JSON", "ApplicationLogLevel": "DEBUG"})"},
       {kImageConfigOption, R"({"EntryPoint": ["/bin/sh"], "Command": ["run"]})"}});

  ASSERT_TRUE(input.parse_violations.empty()) << input.parse_violations.front();
  EXPECT_EQ(input.config.environment, (std::map<std::string, std::string>{{"STAGE", "prod"}}));
  EXPECT_EQ(input.config.tags, (std::map<std::string, std::string>{{"team", "data"}}));
  EXPECT_THAT(*input.config.layers, testing::ElementsAre("arn:aws:lambda:us-east-1:123456789012:layer:l:1"));
  EXPECT_EQ(input.config.vpc_config,
            (VpcConfig{.subnet_ids = {"s-1"}, .security_group_ids = {"sg-1"}, .ipv6_allowed_for_dual_stack = true}));
  ASSERT_EQ(input.config.file_system_configs->size(), 1);
  EXPECT_EQ(input.config.file_system_configs->front().local_mount_path, "/mnt/data");
  EXPECT_EQ(input.config.snap_start, "PublishedVersions");
  EXPECT_EQ(input.config.logging_config,
            (LoggingConfig{.log_format = "JSON", .application_log_level = "DEBUG"}));
  ASSERT_TRUE(input.image_config.has_value());
  EXPECT_THAT(input.image_config->entry_point, testing::ElementsAre("/bin/sh"));
  EXPECT_FALSE(input.image_config->working_directory.has_value());
}

TEST_F(InputParserTest, CollectsAllDecodingProblems) {
  const auto input = ParseDeploymentInput({{kMemorySizeOption, "12x"},
                                           {kDryRunOption, "maybe"},
                                           {kEnvironmentOption, "{not json"},
                                           {kTagsOption, R"({"team": 1})"},
                                           {kSnapStartOption, R"({"Mode": "None"})"},
                                           {kLoggingConfigOption, R"({"LogGroup": "g"})"}});

  EXPECT_THAT(input.parse_violations,
              testing::UnorderedElementsAre(testing::HasSubstr("memory_size: '12x' is not an integer."),
                                            testing::HasSubstr("dry_run: 'maybe' is not a boolean"),
                                            testing::HasSubstr("environment: malformed JSON"),
                                            testing::HasSubstr("tags: expected a JSON object with string values."),
                                            testing::HasSubstr("snap_start: unknown key 'Mode'."),
                                            testing::HasSubstr("snap_start: expected a JSON object"),
                                            testing::HasSubstr("logging_config: LogFormat is required.")));
  EXPECT_FALSE(input.config.memory_size.has_value());
  EXPECT_EQ(input.dry_run, kDefaultDryRun);
}

TEST_F(InputParserTest, RejectsUnknownKeysInJsonObjects) {
  const auto input = ParseDeploymentInput({{kVpcConfigOption, R"({"SubnetIds": [], "Subnets": []})"}});

  EXPECT_THAT(input.parse_violations, testing::ElementsAre("vpc_config: unknown key 'Subnets'."));
}

}  // namespace stratus
