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

// The engine side of the persistent mode protocol: feeds a corpus through a
// harness binary, re-launching the harness as needed, and collects crashes.
// This is not a fuzzing engine: there is no mutation and no coverage
// feedback.

#ifndef THIRD_PARTY_PERENNIAL_CORPUS_RUNNER_H_
#define THIRD_PARTY_PERENNIAL_CORPUS_RUNNER_H_

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "./command.h"
#include "./defs.h"
#include "./environment.h"
#include "./shared_memory_blob_sequence.h"
#include "./util.h"

namespace perennial {

// How a harness process ended.
enum class ExitClass {
  kClean,               // Budget exhausted or channel closed.
  kCrash,               // Killed by a signal, or a sanitizer's exit code.
  kConfigurationError,  // EX_CONFIG.
  kHarnessFault,        // EX_IOERR.
  kTimeout,             // Killed by the runner.
};

const char *ExitClassName(ExitClass exit_class);

// Classifies `exit_code`, as returned by Command::Execute().
ExitClass ClassifyExit(int exit_code, bool timed_out);

struct CorpusRunStats {
  // Inputs on which the target was invoked, including crashing ones.
  size_t num_executions = 0;
  size_t num_launches = 0;
  size_t num_crashes = 0;
  size_t num_timeouts = 0;
  // Files written under Environment::MakeCrashReproducerDirPath().
  std::vector<std::string> crash_files;
  // Not OK if the harness reported a configuration error or a harness fault,
  // or broke the protocol.
  absl::Status status;
};

// Reads every regular file in `dir_path`, in the order of file names.
absl::StatusOr<std::vector<ByteArray>> ReadInputsFromDir(
    std::string_view dir_path);

class CorpusRunner {
 public:
  explicit CorpusRunner(const Environment &env);

  CorpusRunner(const CorpusRunner &) = delete;
  CorpusRunner &operator=(const CorpusRunner &) = delete;

  // Executes every input in `inputs` once, in order.
  // Stops early on a configuration error or a harness fault, if
  // env.exit_on_crash is set and the target crashes, or if an early exit was
  // requested.
  CorpusRunStats Run(const std::vector<ByteArray> &inputs);

 private:
  // Saves `input` to the crash dir and logs the crash.
  void ReportCrash(const ByteArray &input, int exit_code, ExitClass exit_class,
                   CorpusRunStats &stats);
  // Logs the output of the latest launch.
  void LogHarnessOutput() const;

  const Environment &env_;
  std::string temp_dir_ = TemporaryLocalDirPath();
  const std::string execute_log_path_;
  const std::string shmem_name1_ = ProcessAndThreadUniqueID("/perennial-shm1-");
  const std::string shmem_name2_ = ProcessAndThreadUniqueID("/perennial-shm2-");
  SharedMemoryBlobSequence inputs_blobseq_;
  SharedMemoryBlobSequence outputs_blobseq_;
  Command command_;
  size_t num_crash_reports_ = 0;
};

}  // namespace perennial

#endif  // THIRD_PARTY_PERENNIAL_CORPUS_RUNNER_H_
