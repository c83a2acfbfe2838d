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

// WARNING: this code runs inside the fuzzed process. Please avoid Abseil
// and heavy STL usage here, in order to avoid creating new coverage edges
// in the binary.
#include "./persistent_loop.h"

#include <climits>
#include <cstddef>

#include "./channel_protocol.h"
#include "./defs.h"
#include "./input_source.h"
#include "./persistent_mode_signal.h"

namespace perennial {

const char *LoopStateName(LoopState state) {
  switch (state) {
    case LoopState::kAwaitingInput:
      return "awaiting input";
    case LoopState::kInvoking:
      return "invoking";
    case LoopState::kBudgetExhausted:
      return "budget exhausted";
    case LoopState::kChannelClosed:
      return "channel closed";
    case LoopState::kHarnessFault:
      return "harness fault";
  }
  return "unknown";
}

int LoopResult::exit_code() const {
  switch (state) {
    case LoopState::kBudgetExhausted:
    case LoopState::kChannelClosed:
      return kExitGraceful;
    case LoopState::kAwaitingInput:
    case LoopState::kInvoking:
    case LoopState::kHarnessFault:
      break;
  }
  return kExitHarnessFault;
}

bool SharedMemoryProgressObserver::OnInputBegin(size_t index) {
  return channel_protocol::WriteInputBegin(index, blobseq_);
}

bool SharedMemoryProgressObserver::OnInputEnd(size_t index) {
  return channel_protocol::WriteInputEnd(index, blobseq_);
}

bool PersistentLoop::GateAllowsIteration() const {
  if (gate_ == nullptr) return true;
  const unsigned int max_iterations = iteration_budget_ > UINT_MAX
                                          ? UINT_MAX
                                          : iteration_budget_;
  return gate_(max_iterations) != 0;
}

LoopResult PersistentLoop::Run() {
  EmitPersistentModeSignal();
  LoopResult result;
  input_.clear();
  while (true) {
    if (result.num_iterations == iteration_budget_ || !GateAllowsIteration()) {
      state_ = LoopState::kBudgetExhausted;
      break;
    }

    state_ = LoopState::kAwaitingInput;
    const InputStatus status = source_.Next(input_);
    if (status == InputStatus::kEndOfInput) {
      state_ = LoopState::kChannelClosed;
      break;
    }
    if (status == InputStatus::kFault) {
      state_ = LoopState::kHarnessFault;
      result.fault_description = source_.fault_description();
      break;
    }

    state_ = LoopState::kInvoking;
    // The input is not run if its beginning can't be reported: the engine
    // would not be able to attribute a crash to it.
    if (observer_ && !observer_->OnInputBegin(result.num_iterations)) {
      state_ = LoopState::kBudgetExhausted;
      break;
    }
    target_.Invoke(input_);
    ++result.num_iterations;
    input_.clear();
    if (observer_ && !observer_->OnInputEnd(result.num_iterations - 1)) {
      state_ = LoopState::kBudgetExhausted;
      break;
    }
  }
  input_.clear();
  result.state = state_;
  return result;
}

}  // namespace perennial
