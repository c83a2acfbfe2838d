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

#ifndef THIRD_PARTY_PERENNIAL_PERSISTENT_LOOP_H_
#define THIRD_PARTY_PERENNIAL_PERSISTENT_LOOP_H_

#include <cstddef>
#include <string>

#include "./defs.h"
#include "./input_source.h"
#include "./shared_memory_blob_sequence.h"
#include "./target.h"

namespace perennial {

enum class LoopState {
  kAwaitingInput,
  kInvoking,
  // Terminal states.
  kBudgetExhausted,
  kChannelClosed,
  kHarnessFault,
};

const char *LoopStateName(LoopState state);

// What PersistentLoop::Run() ended with.
struct LoopResult {
  LoopState state = LoopState::kAwaitingInput;
  // The number of inputs on which the target returned.
  size_t num_iterations = 0;
  // Set iff state == kHarnessFault.
  std::string fault_description;

  // The process exit code for this result.
  int exit_code() const;
};

// Gets notified around every invocation of the target.
// Either method may return false to end the loop gracefully, e.g. when there
// is no room left to report progress.
class IterationObserver {
 public:
  virtual ~IterationObserver() = default;
  virtual bool OnInputBegin(size_t index) = 0;
  virtual bool OnInputEnd(size_t index) = 0;
};

// Reports progress to the engine via the output blob sequence, see
// channel_protocol.h.
class SharedMemoryProgressObserver : public IterationObserver {
 public:
  explicit SharedMemoryProgressObserver(SharedMemoryBlobSequence &blobseq)
      : blobseq_(blobseq) {}
  bool OnInputBegin(size_t index) override;
  bool OnInputEnd(size_t index) override;

 private:
  SharedMemoryBlobSequence &blobseq_;
};

// An engine-provided iteration gate with the signature of
// __afl_persistent_loop(): returns non-zero while the engine wants the
// process to keep iterating.
using IterationGate = int (*)(unsigned int max_iterations);

// Drives the target through at most `iteration_budget` inputs inside the
// current process.
//
// Every iteration takes one input from `source` and passes it to `target`.
// The loop ends when the budget is spent, the gate says stop, the channel is
// closed, or the channel fails. Crashes inside the target are not
// intercepted: they end the process, and the engine observes them.
//
// `source` and `target` must outlive the loop. `observer` and `gate` are
// optional.
class PersistentLoop {
 public:
  PersistentLoop(InputSource &source, Target &target, size_t iteration_budget,
                 IterationObserver *observer = nullptr,
                 IterationGate gate = nullptr)
      : source_(source),
        target_(target),
        iteration_budget_(iteration_budget),
        observer_(observer),
        gate_(gate) {}

  PersistentLoop(const PersistentLoop &) = delete;
  PersistentLoop &operator=(const PersistentLoop &) = delete;

  LoopResult Run();

  LoopState state() const { return state_; }

 private:
  // Asks the gate, if any, for one more iteration.
  bool GateAllowsIteration() const;

  InputSource &source_;
  Target &target_;
  const size_t iteration_budget_;
  IterationObserver *const observer_;
  const IterationGate gate_;

  LoopState state_ = LoopState::kAwaitingInput;
  // Reused across iterations, truncated after every iteration.
  ByteArray input_;
};

}  // namespace perennial

#endif  // THIRD_PARTY_PERENNIAL_PERSISTENT_LOOP_H_
