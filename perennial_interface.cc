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

#include "./perennial_interface.h"

#include <signal.h>

#include <cstdlib>
#include <vector>

#include "absl/base/internal/raw_logging.h"
#include "absl/status/statusor.h"
#include "./corpus_runner.h"
#include "./defs.h"
#include "./environment.h"
#include "./logging.h"
#include "./util.h"

namespace perennial {

namespace {

// Sets signal handler for SIGINT.
void SetSignalHandlers() {
  struct sigaction sigact = {};
  sigact.sa_handler = [](int) {
    ABSL_RAW_LOG(INFO, "SIGINT caught; cleaning up\n");
    RequestEarlyExit(EXIT_FAILURE);
  };
  sigaction(SIGINT, &sigact, nullptr);
}

}  // namespace

int PerennialMain(const Environment &env) {
  SetSignalHandlers();

  if (env.binary.empty() || env.input_dir.empty() || env.output_dir.empty()) {
    LOG(ERROR) << "--binary, --input_dir and --output_dir must be set";
    return EXIT_FAILURE;
  }
  if (env.iterations == 0 || env.max_len == 0 || env.shmem_size_mb == 0) {
    LOG(ERROR) << "--iterations, --max_len and --shmem_size_mb must be "
                  "positive";
    return EXIT_FAILURE;
  }

  absl::StatusOr<std::vector<ByteArray>> inputs =
      ReadInputsFromDir(env.input_dir);
  if (!inputs.ok()) {
    LOG(ERROR) << "Failed to read the corpus: " << inputs.status();
    return EXIT_FAILURE;
  }
  LOG(INFO) << "Read " << inputs->size() << " inputs from " << env.input_dir;

  CorpusRunner runner(env);
  const CorpusRunStats stats = runner.Run(*inputs);
  LOG(INFO) << "Done: " << VV(stats.num_executions) << VV(stats.num_launches)
            << VV(stats.num_crashes) << VV(stats.num_timeouts);
  for (const auto &crash_file : stats.crash_files) {
    LOG(INFO) << "Crash reproducer: " << crash_file;
  }
  if (!stats.status.ok()) {
    LOG(ERROR) << "Run failed: " << stats.status;
    return EXIT_FAILURE;
  }
  if (EarlyExitRequested()) return ExitCode();
  return EXIT_SUCCESS;
}

}  // namespace perennial
