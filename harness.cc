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

// The persistent mode harness: wires the flags, the input channel and the
// target together and runs the loop.
//
// WARNING: this code runs inside the fuzzed process. Please avoid Abseil
// and heavy STL usage here, in order to avoid creating new coverage edges
// in the binary.
#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "./defs.h"
#include "./harness_flags.h"
#include "./harness_interface.h"
#include "./input_source.h"
#include "./persistent_loop.h"
#include "./persistent_mode_signal.h"
#include "./shared_memory_blob_sequence.h"
#include "./target.h"

// The AFL++ runtime defines this when the target is built with afl-clang-fast.
// Without it the loop is bounded by the `iterations` flag alone.
extern "C" __attribute__((weak)) int __afl_persistent_loop(
    unsigned int max_iterations);

namespace perennial {
namespace {

// ASAN/TSAN/MSAN can not be used with RLIMIT_AS.
#if !defined(ADDRESS_SANITIZER) && !defined(THREAD_SANITIZER) && \
    !defined(MEMORY_SANITIZER) && !defined(__SANITIZE_ADDRESS__) &&   \
    !defined(__SANITIZE_THREAD__)
constexpr bool kCanUseRlimitAs = true;
#else
constexpr bool kCanUseRlimitAs = false;
#endif

// Sets RLIMIT_CORE, RLIMIT_AS
void SetLimits(const HarnessConfig &config) {
  // no core files anywhere.
  struct rlimit rlimit_core = {0, 0};
  setrlimit(RLIMIT_CORE, &rlimit_core);

  // No-op under ASAN/TSAN/MSAN.
  if constexpr (kCanUseRlimitAs) {
    if (config.address_space_limit_mb > 0) {
      size_t limit_in_bytes = config.address_space_limit_mb << 20;
      struct rlimit rlimit_as = {limit_in_bytes, limit_in_bytes};
      setrlimit(RLIMIT_AS, &rlimit_as);
    }
  }
}

int ConfigurationError(const std::string &error) {
  fprintf(stderr, "perennial harness: configuration error: %s\n",
          error.c_str());
  return kExitConfigurationError;
}

// Opens the shared memory region `name`, or sets `error`.
std::unique_ptr<SharedMemoryBlobSequence> OpenSharedMemory(
    const std::string &name, std::string &error) {
  auto blobseq = SharedMemoryBlobSequence::OpenExisting(name.c_str());
  if (!blobseq) {
    error = "can't open shared memory " + name + ": " + strerror(errno);
  }
  return blobseq;
}

// Checks that `fd` is open for reading, or sets `error`.
bool CheckInputFd(int fd, std::string &error) {
  const int flags = fcntl(fd, F_GETFL);
  if (flags < 0) {
    error = "input fd " + std::to_string(fd) + " is not open: " +
            strerror(errno);
    return false;
  }
  if ((flags & O_ACCMODE) == O_WRONLY) {
    error = "input fd " + std::to_string(fd) + " is not open for reading";
    return false;
  }
  return true;
}

// Everything the loop uses, owned for the duration of the harness.
struct Harness {
  std::unique_ptr<DsoTarget> dso_target;
  std::unique_ptr<Target> linked_target;
  Target *target = nullptr;
  std::unique_ptr<SharedMemoryBlobSequence> inputs_blobseq;
  std::unique_ptr<SharedMemoryBlobSequence> outputs_blobseq;
  std::unique_ptr<SharedMemoryProgressObserver> progress_observer;
  std::unique_ptr<InputSource> source;
};

// Sets up the target. Returns false and sets `error` on failure.
bool SetUpTarget(const HarnessConfig &config,
                 PerennialTestOneInputCallback test_one_input_cb,
                 Harness &harness, std::string &error) {
  if (test_one_input_cb != nullptr) {
    if (!config.dso.empty()) {
      error = "the dso flag is given to a harness with a linked-in target";
      return false;
    }
    harness.linked_target = std::make_unique<BytesTarget>(test_one_input_cb);
    harness.target = harness.linked_target.get();
    return true;
  }
  if (config.dso.empty()) {
    error = "missing target: set the dso and symbol flags";
    return false;
  }
  harness.dso_target = DsoTarget::Load(config.dso, config.symbol,
                                       config.init_symbol, config.convention,
                                       error);
  if (!harness.dso_target) return false;
  harness.target = harness.dso_target.get();
  return true;
}

// Sets up the input channel and, if requested, progress reporting.
// Returns false and sets `error` on failure.
bool SetUpInputs(const HarnessConfig &config, int argc, char **argv,
                 Harness &harness, std::string &error) {
  switch (config.channel) {
    case Channel::kStdin:
    case Channel::kFd:
      if (!CheckInputFd(config.input_fd, error)) return false;
      harness.source = std::make_unique<StreamInputSource>(
          config.input_fd, config.max_len, config.framing);
      break;
    case Channel::kShmem:
      harness.inputs_blobseq = OpenSharedMemory(config.shmem_in, error);
      if (!harness.inputs_blobseq) return false;
      harness.source = std::make_unique<SharedMemoryInputSource>(
          *harness.inputs_blobseq, config.max_len);
      break;
    case Channel::kFiles: {
      std::vector<std::string> paths;
      for (int i = 1; i < argc; ++i) paths.emplace_back(argv[i]);
      harness.source = std::make_unique<FileListInputSource>(std::move(paths),
                                                             config.max_len);
      break;
    }
  }
  if (!harness.source) {
    error = "unknown channel";
    return false;
  }
  if (!config.shmem_out.empty()) {
    harness.outputs_blobseq = OpenSharedMemory(config.shmem_out, error);
    if (!harness.outputs_blobseq) return false;
    harness.progress_observer = std::make_unique<SharedMemoryProgressObserver>(
        *harness.outputs_blobseq);
  }
  return true;
}

}  // namespace

// Create a fake reference to EmitPersistentModeSignal() here so that the
// marker is not dropped during linking, even when the harness library is
// linked as an archive.
auto fake_reference_for_persistent_mode_signal = &EmitPersistentModeSignal;

}  // namespace perennial

// argc/argv are passed to the target initializer and, with channel=files,
// list the input files.
extern "C" int PerennialHarnessMain(
    int argc, char **argv, PerennialTestOneInputCallback test_one_input_cb,
    PerennialInitializeCallback initialize_cb) {
  using perennial::Harness;
  using perennial::HarnessConfig;
  const char *flags = getenv(perennial::kHarnessFlagsEnvVar);
  fprintf(stderr, "perennial harness; argv[0]: %s flags: %s\n", argv[0],
          flags ? flags : "");

  HarnessConfig config;
  std::string error;
  if (!perennial::ParseHarnessConfig(flags, config, error))
    return perennial::ConfigurationError(error);

  perennial::SetLimits(config);

  Harness harness;
  if (!perennial::SetUpTarget(config, test_one_input_cb, harness, error) ||
      !perennial::SetUpInputs(config, argc, argv, harness, error)) {
    return perennial::ConfigurationError(error);
  }

  // All further actions will execute code in the target,
  // so we need to call the initializer first.
  if (initialize_cb) initialize_cb(&argc, &argv);
  if (harness.dso_target) harness.dso_target->Initialize(&argc, &argv);

  perennial::PersistentLoop loop(*harness.source, *harness.target,
                                 config.iterations,
                                 harness.progress_observer.get(),
                                 __afl_persistent_loop);
  const perennial::LoopResult result = loop.Run();
  if (result.state == perennial::LoopState::kHarnessFault) {
    fprintf(stderr,
            "perennial harness: harness fault after %zu iterations: %s\n",
            result.num_iterations, result.fault_description.c_str());
  } else {
    fprintf(stderr, "perennial harness: %s after %zu iterations\n",
            perennial::LoopStateName(result.state), result.num_iterations);
  }
  return result.exit_code();
}
