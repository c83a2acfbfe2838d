// Copyright 2022 The Centipede Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "./harness_flags.h"

#include <cstdint>
#include <string>

#include "gtest/gtest.h"
#include "./defs.h"

namespace perennial {
namespace {

TEST(HarnessFlags, GetStringFlag) {
  HarnessFlags flags(":name=value:empty=:last=x");
  std::string value;
  EXPECT_TRUE(flags.GetStringFlag(":name=", value));
  EXPECT_EQ(value, "value");
  EXPECT_TRUE(flags.GetStringFlag(":empty=", value));
  EXPECT_EQ(value, "");
  // Not terminated with ':'.
  EXPECT_FALSE(flags.GetStringFlag(":last=", value));
  EXPECT_FALSE(flags.GetStringFlag(":missing=", value));
}

TEST(HarnessFlags, GetIntFlag) {
  HarnessFlags flags(":n=42:bad=4x:neg=-1:");
  uint64_t value = 0;
  EXPECT_TRUE(flags.GetIntFlag(":n=", 7, value));
  EXPECT_EQ(value, 42);
  EXPECT_TRUE(flags.GetIntFlag(":missing=", 7, value));
  EXPECT_EQ(value, 7);
  EXPECT_FALSE(flags.GetIntFlag(":bad=", 7, value));
  EXPECT_FALSE(flags.GetIntFlag(":neg=", 7, value));
}

TEST(ParseHarnessConfig, Defaults) {
  HarnessConfig config;
  std::string error;
  ASSERT_TRUE(ParseHarnessConfig(nullptr, config, error)) << error;
  EXPECT_EQ(config.channel, Channel::kStdin);
  EXPECT_EQ(config.input_fd, 0);
  EXPECT_EQ(config.framing, Framing::kLengthPrefixed);
  EXPECT_EQ(config.max_len, kDefaultMaxInputSize);
  EXPECT_EQ(config.iterations, kDefaultIterationBudget);
  EXPECT_EQ(config.convention, CallingConvention::kBytes);
  EXPECT_EQ(config.address_space_limit_mb, 0);
  EXPECT_TRUE(config.shmem_in.empty());
  EXPECT_TRUE(config.dso.empty());
}

TEST(ParseHarnessConfig, AllFlags) {
  HarnessConfig config;
  std::string error;
  ASSERT_TRUE(ParseHarnessConfig(
      ":channel=shmem:shmem_in=/in:shmem_out=/out:framing=raw:max_len=16:"
      "iterations=3:dso=/lib/ext.so:symbol=Parse:init_symbol=Init:"
      "convention=string_and_size:address_space_limit_mb=100:",
      config, error))
      << error;
  EXPECT_EQ(config.channel, Channel::kShmem);
  EXPECT_EQ(config.shmem_in, "/in");
  EXPECT_EQ(config.shmem_out, "/out");
  EXPECT_EQ(config.framing, Framing::kRaw);
  EXPECT_EQ(config.max_len, 16);
  EXPECT_EQ(config.iterations, 3);
  EXPECT_EQ(config.dso, "/lib/ext.so");
  EXPECT_EQ(config.symbol, "Parse");
  EXPECT_EQ(config.init_symbol, "Init");
  EXPECT_EQ(config.convention, CallingConvention::kStringAndSize);
  EXPECT_EQ(config.address_space_limit_mb, 100);
}

TEST(ParseHarnessConfig, InputFd) {
  HarnessConfig config;
  std::string error;
  ASSERT_TRUE(ParseHarnessConfig(":channel=fd:input_fd=5:", config, error));
  EXPECT_EQ(config.channel, Channel::kFd);
  EXPECT_EQ(config.input_fd, 5);
  // stdin always reads fd 0.
  ASSERT_TRUE(ParseHarnessConfig(":channel=stdin:input_fd=5:", config, error));
  EXPECT_EQ(config.input_fd, 0);
}

TEST(ParseHarnessConfig, Limits) {
  HarnessConfig config;
  std::string error;
  ASSERT_TRUE(ParseHarnessConfig(":max_len=4294967295:", config, error))
      << error;
  EXPECT_EQ(config.max_len, UINT32_MAX);
  ASSERT_TRUE(ParseHarnessConfig(":address_space_limit_mb=17592186044415:",
                                 config, error))
      << error;
  EXPECT_EQ(config.address_space_limit_mb, SIZE_MAX >> 20);
}

TEST(ParseHarnessConfig, ConfigurationErrors) {
  const char *bad_flags[] = {
      ":channel=socket:",
      ":framing=lines:",
      ":convention=fortran:",
      ":iterations=0:",
      ":iterations=many:",
      ":max_len=0:",
      ":max_len=4294967296:",
      ":max_len=18446744073709551615:",
      ":address_space_limit_mb=17592186044416:",
      ":address_space_limit_mb=-1:",
      ":input_fd=99999999999:",
      ":channel=shmem:",
      ":dso=/lib/ext.so:",
      ":symbol=Parse:",
      ":init_symbol=Init:",
  };
  for (const char *flags : bad_flags) {
    HarnessConfig config;
    std::string error;
    EXPECT_FALSE(ParseHarnessConfig(flags, config, error)) << flags;
    EXPECT_FALSE(error.empty()) << flags;
  }
}

}  // namespace
}  // namespace perennial
