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

#include "./environment.h"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "absl/flags/flag.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "./defs.h"

ABSL_FLAG(std::string, binary, "",
          "The harness binary. It is launched with PERENNIAL_HARNESS_FLAGS "
          "set to read inputs from shared memory.");
ABSL_FLAG(std::string, input_dir, "",
          "Directory with the seed corpus, one file per input. Not recursive. "
          "Files are executed in the order of their names.");
ABSL_FLAG(std::string, output_dir, "",
          "Directory where crash-triggering inputs are saved, under "
          "crashes/, with the sha1 of the input as the file name.");
ABSL_FLAG(size_t, iterations, perennial::kDefaultIterationBudget,
          "The iteration budget of one harness process. After this many "
          "inputs the harness exits and is launched again.");
ABSL_FLAG(size_t, max_len, perennial::kDefaultMaxInputSize,
          "Max length of one input, in bytes. Longer inputs are truncated "
          "by the harness.");
ABSL_FLAG(size_t, timeout, 0,
          "Timeout in seconds (if not zero) of one harness launch. A harness "
          "process that runs longer is killed and the input it was running "
          "is reported as a hang.");
ABSL_FLAG(size_t, shmem_size_mb, 1024,
          "Size of the shared memory region used to pass inputs to the "
          "harness. Inputs that don't fit are passed in later launches.");
ABSL_FLAG(size_t, address_space_limit_mb, 8192,
          "If not zero, instructs the harness to set setrlimit(RLIMIT_AS) to "
          "this number of megabytes. "
          "Harnesses built with ASAN, which can't run with RLIMIT_AS, ignore "
          "this flag.");
ABSL_FLAG(std::string, harness_flags, "",
          "Extra flags for the harness, in the PERENNIAL_HARNESS_FLAGS "
          "format, e.g. ':dso=/path/ext.so:symbol=Parse:convention=cstring:'. "
          "Appended to the flags set by the runner.");
ABSL_FLAG(bool, exit_on_crash, false,
          "If true, the runner will exit on the first crash of the target");
ABSL_FLAG(size_t, num_crash_reports, 5,
          "Log details (harness output, input bytes) for this many crashes. "
          "Every crash-triggering input is saved regardless.");

namespace perennial {

Environment::Environment()
    : binary(absl::GetFlag(FLAGS_binary)),
      input_dir(absl::GetFlag(FLAGS_input_dir)),
      output_dir(absl::GetFlag(FLAGS_output_dir)),
      iterations(absl::GetFlag(FLAGS_iterations)),
      max_len(absl::GetFlag(FLAGS_max_len)),
      timeout(absl::GetFlag(FLAGS_timeout)),
      shmem_size_mb(absl::GetFlag(FLAGS_shmem_size_mb)),
      address_space_limit_mb(absl::GetFlag(FLAGS_address_space_limit_mb)),
      harness_flags(absl::GetFlag(FLAGS_harness_flags)),
      exit_on_crash(absl::GetFlag(FLAGS_exit_on_crash)),
      max_num_crash_reports(absl::GetFlag(FLAGS_num_crash_reports)) {}

std::string Environment::MakeCrashReproducerDirPath() const {
  return std::filesystem::path(output_dir).append("crashes");
}

std::string Environment::MakeHarnessFlags(std::string_view shmem_in,
                                          std::string_view shmem_out) const {
  std::string flags = absl::StrCat(
      ":channel=shmem:shmem_in=", shmem_in, ":shmem_out=", shmem_out,
      ":iterations=", iterations, ":max_len=", max_len,
      ":address_space_limit_mb=", address_space_limit_mb, ":");
  if (!harness_flags.empty()) {
    // Both strings are ':'-delimited; avoid an empty "::" in between.
    absl::StrAppend(&flags, absl::StartsWith(harness_flags, ":")
                                ? harness_flags.substr(1)
                                : harness_flags);
    if (!absl::EndsWith(flags, ":")) flags.push_back(':');
  }
  return flags;
}

}  // namespace perennial
