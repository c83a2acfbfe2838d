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

#ifndef THIRD_PARTY_PERENNIAL_ENVIRONMENT_H_
#define THIRD_PARTY_PERENNIAL_ENVIRONMENT_H_

#include <cstddef>
#include <string>
#include <string_view>

namespace perennial {

// Engine-side environment that is initialized at startup and doesn't change.
// Data fields are copied from the FLAGS defined in environment.cc,
// or derived from them. See FLAGS descriptions for comments.
// Users or tests can override any of the non-const fields after the object
// is constructed, but before it is passed to CorpusRunner.
struct Environment {
  Environment();

  std::string binary;
  std::string input_dir;
  std::string output_dir;
  size_t iterations;
  size_t max_len;
  size_t timeout;
  size_t shmem_size_mb;
  size_t address_space_limit_mb;
  std::string harness_flags;
  bool exit_on_crash;
  size_t max_num_crash_reports;

  // Returns the path to the crash reproducer dir.
  std::string MakeCrashReproducerDirPath() const;
  // Returns the value of PERENNIAL_HARNESS_FLAGS for a harness that reads
  // inputs from the shared memory region `shmem_in` and reports progress to
  // `shmem_out`.
  std::string MakeHarnessFlags(std::string_view shmem_in,
                               std::string_view shmem_out) const;
};

}  // namespace perennial

#endif  // THIRD_PARTY_PERENNIAL_ENVIRONMENT_H_
