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

#include "./corpus_runner.h"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "./channel_protocol.h"
#include "./command.h"
#include "./defs.h"
#include "./environment.h"
#include "./harness_flags.h"
#include "./logging.h"
#include "./util.h"

namespace perennial {

namespace {

absl::Duration LaunchTimeout(const Environment &env) {
  if (env.timeout == 0) return absl::InfiniteDuration();
  return absl::Seconds(env.timeout);
}

}  // namespace

const char *ExitClassName(ExitClass exit_class) {
  switch (exit_class) {
    case ExitClass::kClean:
      return "clean exit";
    case ExitClass::kCrash:
      return "crash";
    case ExitClass::kConfigurationError:
      return "configuration error";
    case ExitClass::kHarnessFault:
      return "harness fault";
    case ExitClass::kTimeout:
      return "timeout";
  }
  return "unknown";
}

ExitClass ClassifyExit(int exit_code, bool timed_out) {
  if (timed_out) return ExitClass::kTimeout;
  if (exit_code == kExitGraceful) return ExitClass::kClean;
  if (exit_code == kExitConfigurationError)
    return ExitClass::kConfigurationError;
  if (exit_code == kExitHarnessFault) return ExitClass::kHarnessFault;
  // A signal, or whatever exit code the sanitizer chose.
  return ExitClass::kCrash;
}

absl::StatusOr<std::vector<ByteArray>> ReadInputsFromDir(
    std::string_view dir_path) {
  std::error_code error;
  if (!std::filesystem::is_directory(dir_path, error)) {
    return absl::NotFoundError(absl::StrCat("not a directory: ", dir_path));
  }
  std::vector<ByteArray> inputs;
  for (const auto &path : ListLocalFilesInDir(dir_path)) {
    ReadFromLocalFile(path, inputs.emplace_back());
  }
  return inputs;
}

CorpusRunner::CorpusRunner(const Environment &env)
    : env_(env),
      execute_log_path_(std::filesystem::path(temp_dir_).append("log")),
      inputs_blobseq_(shmem_name1_.c_str(), env.shmem_size_mb << 20),
      outputs_blobseq_(shmem_name2_.c_str(), env.shmem_size_mb << 20),
      command_(env.binary, {},
               {absl::StrCat(kHarnessFlagsEnvVar, "=",
                             env.MakeHarnessFlags(shmem_name1_, shmem_name2_))},
               execute_log_path_, execute_log_path_, LaunchTimeout(env)) {
  CHECK_GT(env_.iterations, 0);
  CreateLocalDirRemovedAtExit(temp_dir_);
}

CorpusRunStats CorpusRunner::Run(const std::vector<ByteArray> &inputs) {
  CorpusRunStats stats;
  // Index of the first input not yet executed.
  size_t next = 0;
  while (next < inputs.size()) {
    if (EarlyExitRequested()) {
      LOG(INFO) << "Early exit requested";
      break;
    }
    // One harness process runs at most env_.iterations inputs.
    const size_t end = std::min(inputs.size(), next + env_.iterations);
    const std::vector<ByteArray> batch(inputs.begin() + next,
                                       inputs.begin() + end);
    inputs_blobseq_.Reset();
    outputs_blobseq_.Clear();
    const size_t num_inputs_written =
        channel_protocol::WriteInputs(batch, inputs_blobseq_);
    if (num_inputs_written == 0) {
      LOG(ERROR) << "Input " << next << " of " << batch.front().size()
                 << " bytes does not fit into shared memory, skipping it; "
                    "shmem_size_mb might be too small: "
                 << env_.shmem_size_mb;
      ++next;
      continue;
    }
    if (num_inputs_written != batch.size()) {
      VLOG(1) << "Wrote " << num_inputs_written << "/" << batch.size()
              << " inputs; the rest goes to the next launch";
    }

    const int exit_code = command_.Execute();
    ++stats.num_launches;
    const ExitClass exit_class = ClassifyExit(exit_code, command_.timed_out());
    outputs_blobseq_.Reset();
    const channel_protocol::Progress progress =
        channel_protocol::ReadProgress(outputs_blobseq_);
    VLOG(1) << "Launch " << stats.num_launches << ": "
            << ExitClassName(exit_class) << VV(exit_code)
            << VV(progress.num_begun) << VV(progress.num_finished);
    if (progress.malformed || progress.num_begun > num_inputs_written) {
      LogHarnessOutput();
      stats.status = absl::DataLossError(
          "the harness reported malformed progress via shared memory");
      return stats;
    }

    switch (exit_class) {
      case ExitClass::kClean:
        // The harness may exit w/o reporting the end of the last input it
        // ran, if there was no room left to report it: count it as executed.
        if (progress.num_begun == 0) {
          LogHarnessOutput();
          stats.status = absl::InternalError(
              "the harness exited cleanly w/o running any input");
          return stats;
        }
        stats.num_executions += progress.num_begun;
        next += progress.num_begun;
        break;
      case ExitClass::kCrash:
      case ExitClass::kTimeout:
        if (!progress.DiedInsideTarget()) {
          LogHarnessOutput();
          stats.status = absl::AbortedError(absl::StrCat(
              "the harness ended with a ", ExitClassName(exit_class),
              " while not running an input; exit code: ", exit_code));
          return stats;
        }
        stats.num_executions += progress.num_begun;
        ReportCrash(batch[progress.num_finished], exit_code, exit_class,
                    stats);
        next += progress.num_begun;
        if (env_.exit_on_crash) {
          LOG(INFO) << "--exit_on_crash is enabled; exiting soon";
          return stats;
        }
        break;
      case ExitClass::kConfigurationError:
        LogHarnessOutput();
        stats.status = absl::FailedPreconditionError(
            absl::StrCat("the harness reported a configuration error; see its "
                         "output above; command: ",
                         command_.ToString()));
        return stats;
      case ExitClass::kHarnessFault:
        LogHarnessOutput();
        stats.status = absl::DataLossError(
            "the harness failed to read its inputs; see its output above");
        return stats;
    }
  }
  return stats;
}

void CorpusRunner::ReportCrash(const ByteArray &input, int exit_code,
                               ExitClass exit_class, CorpusRunStats &stats) {
  if (exit_class == ExitClass::kTimeout) {
    ++stats.num_timeouts;
  } else {
    ++stats.num_crashes;
  }
  const std::string crash_dir = env_.MakeCrashReproducerDirPath();
  std::error_code error;
  std::filesystem::create_directories(crash_dir, error);
  CHECK(!error) << "Failed to create " << crash_dir << ": " << error.message();
  const std::string file_path = WriteToLocalHashedFileInDir(crash_dir, input);
  stats.crash_files.push_back(file_path);

  if (num_crash_reports_ >= env_.max_num_crash_reports) return;
  const std::string log_prefix =
      absl::StrCat("ReportCrash[", num_crash_reports_, "]: ");
  LOG(INFO) << log_prefix << ExitClassName(exit_class)
            << " detected, saved input to " << file_path;
  LOG(INFO) << log_prefix << "Input bytes: " << AsString(input);
  LOG(INFO) << log_prefix << "Exit code: " << exit_code;
  LogHarnessOutput();
  ++num_crash_reports_;
  if (num_crash_reports_ == env_.max_num_crash_reports) {
    LOG(INFO)
        << log_prefix
        << "Reached max number of crash reports (--num_crash_reports): "
           "further reports will be suppressed";
  }
}

void CorpusRunner::LogHarnessOutput() const {
  std::string log;
  if (std::filesystem::exists(execute_log_path_)) {
    ReadFromLocalFile(execute_log_path_, log);
  }
  // Print the full log contents to stderr (LOG(INFO) will truncate it).
  std::cerr << "Log of the harness follows: [[[==================\n"
            << log << "==================]]]\n";
}

}  // namespace perennial
