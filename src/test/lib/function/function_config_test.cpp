#include "function/function_config.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace stratus {

TEST(FunctionConfigTest, ListsSetFieldsInDeclarationOrder) {
  const FunctionConfig config{.timeout = 10, .environment = std::map<std::string, std::string>{}};

  EXPECT_THAT(config.SetFieldNames(), testing::ElementsAre("timeout", "environment"));
  EXPECT_FALSE(config.IsEmpty());
  EXPECT_TRUE(FunctionConfig{}.IsEmpty());
}

TEST(FunctionConfigTest, DistinguishesClearedFromUnset) {
  const FunctionConfig cleared{.environment = std::map<std::string, std::string>{}};

  EXPECT_NE(cleared, FunctionConfig{});
  EXPECT_EQ(cleared, (FunctionConfig{.environment = std::map<std::string, std::string>{}}));
}

}  // namespace stratus
