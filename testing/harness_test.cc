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

// Runs the harness binaries the way an engine would: with
// PERENNIAL_HARNESS_FLAGS set and the inputs on stdin or in files.
#include <signal.h>
#include <sys/wait.h>  // NOLINT(for WTERMSIG)

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gtest/gtest.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "./command.h"
#include "./defs.h"
#include "./harness_flags.h"
#include "./persistent_mode_signal.h"
#include "./test_util.h"
#include "./util.h"

namespace perennial {
namespace {

// Returns `inputs` as a length-prefixed stream.
std::string LengthPrefixedStream(const std::vector<std::string> &inputs) {
  std::string stream;
  for (const auto &input : inputs) {
    const uint32_t size = input.size();
    for (int i = 0; i < 4; ++i) stream.push_back((size >> (8 * i)) & 0xFF);
    stream.append(input);
  }
  return stream;
}

struct HarnessRun {
  int exit_code = 0;
  // stdout and stderr of the harness.
  std::string output;
};

class HarnessTest : public testing::Test {
 protected:
  HarnessTest() : temp_dir_("HarnessTest") {}

  // Runs `binary` with `flags`, `stdin_contents` on stdin, and `args`.
  HarnessRun Run(std::string_view binary, std::string_view flags,
                 std::string_view stdin_contents,
                 std::vector<std::string> args = {}) {
    const std::string in = temp_dir_.GetFilePath("stdin");
    const std::string out = temp_dir_.GetFilePath("output");
    WriteToLocalFile(in, stdin_contents);
    Command command(GetDataDependencyFilepath(binary).string(),
                    std::move(args),
                    {absl::StrCat(kHarnessFlagsEnvVar, "=", flags)},
                    out, out, absl::InfiniteDuration(), in);
    HarnessRun run;
    run.exit_code = command.Execute();
    ReadFromLocalFile(out, run.output);
    return run;
  }

  std::string TestExtensionPath() const {
    return GetDataDependencyFilepath("test_extension.so").string();
  }

  ScopedTempDir temp_dir_;
};

TEST_F(HarnessTest, LengthPrefixedInputsOnStdin) {
  const HarnessRun run =
      Run("test_harness", "", LengthPrefixedStream({"1234", "", "xyz"}));
  EXPECT_EQ(run.exit_code, kExitGraceful) << run.output;
  EXPECT_TRUE(absl::StrContains(run.output, "LLVMFuzzerInitialize: argc=1"))
      << run.output;
  EXPECT_TRUE(absl::StrContains(run.output,
                                "{31, 32, 33, 34}\n{}\n{78, 79, 7a}\n"))
      << run.output;
  EXPECT_TRUE(
      absl::StrContains(run.output, "channel closed after 3 iterations"))
      << run.output;
}

TEST_F(HarnessTest, InitializerRunsOnceBeforeTheFirstInput) {
  const HarnessRun run =
      Run("test_harness", ":iterations=10:", LengthPrefixedStream({"a", "b"}));
  EXPECT_EQ(run.exit_code, kExitGraceful) << run.output;
  const size_t init = run.output.find("LLVMFuzzerInitialize");
  ASSERT_NE(init, std::string::npos) << run.output;
  EXPECT_EQ(run.output.find("LLVMFuzzerInitialize", init + 1),
            std::string::npos);
  EXPECT_LT(init, run.output.find("{61}"));
}

TEST_F(HarnessTest, BudgetExhausted) {
  const HarnessRun run = Run("test_harness", ":iterations=2:",
                             LengthPrefixedStream({"a", "b", "c"}));
  EXPECT_EQ(run.exit_code, kExitGraceful) << run.output;
  EXPECT_TRUE(absl::StrContains(run.output, "{61}\n{62}\n")) << run.output;
  EXPECT_FALSE(absl::StrContains(run.output, "{63}")) << run.output;
  EXPECT_TRUE(
      absl::StrContains(run.output, "budget exhausted after 2 iterations"))
      << run.output;
}

TEST_F(HarnessTest, EmptyStream) {
  const HarnessRun run = Run("test_harness", "", "");
  EXPECT_EQ(run.exit_code, kExitGraceful) << run.output;
  EXPECT_TRUE(
      absl::StrContains(run.output, "channel closed after 0 iterations"))
      << run.output;
}

TEST_F(HarnessTest, CrashInTheSecondIteration) {
  const HarnessRun run = Run("test_harness", ":iterations=2:",
                             LengthPrefixedStream({"1234", "ABCD"}));
  ASSERT_TRUE(WIFSIGNALED(run.exit_code)) << run.output;
  EXPECT_EQ(WTERMSIG(run.exit_code), SIGABRT);
  EXPECT_TRUE(
      absl::StrContains(run.output, "{31, 32, 33, 34}\n{41, 42, 43, 44}\n"))
      << run.output;
  EXPECT_FALSE(absl::StrContains(run.output, "after 2 iterations"))
      << run.output;
}

TEST_F(HarnessTest, InputsLongerThanMaxLenAreCut) {
  const HarnessRun run = Run("test_harness", ":max_len=3:",
                             LengthPrefixedStream({"ABCD", "xyz", "12345"}));
  EXPECT_EQ(run.exit_code, kExitGraceful) << run.output;
  EXPECT_TRUE(absl::StrContains(run.output, "{78, 79, 7a}")) << run.output;
  EXPECT_TRUE(
      absl::StrContains(run.output, "channel closed after 3 iterations"))
      << run.output;
}

TEST_F(HarnessTest, RawFraming) {
  const HarnessRun run = Run("test_harness", ":framing=raw:", "hello");
  EXPECT_EQ(run.exit_code, kExitGraceful) << run.output;
  EXPECT_TRUE(absl::StrContains(run.output, "{68, 65, 6c, 6c, 6f}"))
      << run.output;
  EXPECT_TRUE(
      absl::StrContains(run.output, "channel closed after 1 iterations"))
      << run.output;
}

TEST_F(HarnessTest, FileList) {
  const std::string file1 = temp_dir_.GetFilePath("file1");
  const std::string file2 = temp_dir_.GetFilePath("file2");
  WriteToLocalFile(file1, std::string_view("ab"));
  WriteToLocalFile(file2, std::string_view("c"));
  const HarnessRun run =
      Run("test_harness", ":channel=files:", "", {file1, file2});
  EXPECT_EQ(run.exit_code, kExitGraceful) << run.output;
  EXPECT_TRUE(absl::StrContains(run.output, "LLVMFuzzerInitialize: argc=3"))
      << run.output;
  EXPECT_TRUE(absl::StrContains(run.output, "{61, 62}\n{63}\n"))
      << run.output;
}

TEST_F(HarnessTest, LargestMaxLen) {
  const HarnessRun raw =
      Run("test_harness", ":framing=raw:max_len=4294967295:", "raw");
  EXPECT_EQ(raw.exit_code, kExitGraceful) << raw.output;
  EXPECT_TRUE(absl::StrContains(raw.output, "{72, 61, 77}")) << raw.output;

  const std::string file = temp_dir_.GetFilePath("file");
  WriteToLocalFile(file, std::string_view("f"));
  const HarnessRun files =
      Run("test_harness", ":channel=files:max_len=4294967295:", "", {file});
  EXPECT_EQ(files.exit_code, kExitGraceful) << files.output;
  EXPECT_TRUE(absl::StrContains(files.output, "{66}")) << files.output;
}

TEST_F(HarnessTest, ClosedInputFdIsAConfigurationError) {
  const HarnessRun run = Run("test_harness", ":channel=fd:input_fd=99:", "");
  EXPECT_EQ(run.exit_code, kExitConfigurationError) << run.output;
  EXPECT_TRUE(absl::StrContains(run.output, "input fd 99 is not open"))
      << run.output;
  EXPECT_FALSE(absl::StrContains(run.output, "harness fault")) << run.output;
}

TEST_F(HarnessTest, TruncatedRecordIsAHarnessFault) {
  std::string stream = LengthPrefixedStream({"1234", "abcdefgh"});
  stream.resize(stream.size() - 3);
  const HarnessRun run = Run("test_harness", "", stream);
  EXPECT_EQ(run.exit_code, kExitHarnessFault) << run.output;
  EXPECT_TRUE(absl::StrContains(run.output, "{31, 32, 33, 34}"))
      << run.output;
  EXPECT_TRUE(absl::StrContains(run.output, "harness fault after 1 iterations"))
      << run.output;
}

TEST_F(HarnessTest, ConfigurationErrors) {
  for (const char *flags :
       {":framing=bogus:", ":channel=shmem:", ":iterations=0:",
        ":dso=ext.so:symbol=Parse:", ":channel=fd:input_fd=99:",
        ":framing=raw:max_len=18446744073709551615:",
        ":channel=files:max_len=100000000000:",
        ":address_space_limit_mb=17592186044416:"}) {
    const HarnessRun run = Run("test_harness", flags, "");
    EXPECT_EQ(run.exit_code, kExitConfigurationError) << flags << run.output;
    EXPECT_TRUE(absl::StrContains(run.output, "configuration error"))
        << run.output;
    // The target never runs.
    EXPECT_FALSE(absl::StrContains(run.output, "LLVMFuzzerInitialize"))
        << run.output;
  }
}

TEST_F(HarnessTest, DsoTargetWithCStrings) {
  const HarnessRun run = Run(
      "perennial_dso_harness",
      absl::StrCat(":dso=", TestExtensionPath(),
                   ":symbol=ParseRecord:init_symbol=InitializeExtension:"
                   "convention=cstring:"),
      LengthPrefixedStream({"first", "second"}));
  EXPECT_EQ(run.exit_code, kExitGraceful) << run.output;
  EXPECT_TRUE(absl::StrContains(run.output, "InitializeExtension: argc=1"))
      << run.output;
  EXPECT_TRUE(absl::StrContains(
      run.output, "ParseRecord: first\nParseRecord: second\n"))
      << run.output;
}

TEST_F(HarnessTest, DsoTargetCrash) {
  const HarnessRun run = Run(
      "perennial_dso_harness",
      absl::StrCat(":dso=", TestExtensionPath(),
                   ":symbol=ParseRecordWithSize:convention=string_and_size:"),
      LengthPrefixedStream({"12", "ABCD"}));
  ASSERT_TRUE(WIFSIGNALED(run.exit_code)) << run.output;
  EXPECT_EQ(WTERMSIG(run.exit_code), SIGABRT);
  EXPECT_TRUE(absl::StrContains(
      run.output, "ParseRecordWithSize: 2\nParseRecordWithSize: 4\n"))
      << run.output;
}

TEST_F(HarnessTest, DsoConfigurationErrors) {
  const HarnessRun no_target = Run("perennial_dso_harness", "", "");
  EXPECT_EQ(no_target.exit_code, kExitConfigurationError)
      << no_target.output;
  EXPECT_TRUE(absl::StrContains(no_target.output, "missing target"))
      << no_target.output;

  const HarnessRun no_symbol =
      Run("perennial_dso_harness",
          absl::StrCat(":dso=", TestExtensionPath(), ":symbol=NoSuchSymbol:"),
          "");
  EXPECT_EQ(no_symbol.exit_code, kExitConfigurationError)
      << no_symbol.output;

  const HarnessRun no_library = Run(
      "perennial_dso_harness",
      absl::StrCat(":dso=", temp_dir_.GetFilePath("no_such.so"),
                   ":symbol=ParseRecord:"),
      "");
  EXPECT_EQ(no_library.exit_code, kExitConfigurationError)
      << no_library.output;
}

// Engines detect persistent mode by scanning the binary for the marker.
TEST(PersistentModeSignal, IsPresentInTheHarnessBinaries) {
  for (const char *binary : {"test_harness", "perennial_dso_harness"}) {
    std::string contents;
    ReadFromLocalFile(GetDataDependencyFilepath(binary).string(), contents);
    EXPECT_TRUE(absl::StrContains(contents, kPersistentModeSignal)) << binary;
  }
}

}  // namespace
}  // namespace perennial
