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

#ifndef THIRD_PARTY_PERENNIAL_PERSISTENT_MODE_SIGNAL_H_
#define THIRD_PARTY_PERENNIAL_PERSISTENT_MODE_SIGNAL_H_

#include <cstddef>

// The persistent mode marker. AFL-family engines scan the target binary for
// this literal before launching it, and switch to persistent mode if found.
// It must be linked into the final executable: it is marked as `used`, and
// harness.cc keeps a reference to EmitPersistentModeSignal().
extern "C" volatile const char perennial_persistent_mode_signal[];

namespace perennial {

// The value of perennial_persistent_mode_signal.
inline constexpr char kPersistentModeSignal[] = "##SIG_AFL_PERSISTENT##";

// Reads the marker through its volatile qualifier, so that the compiler can
// not drop it. Returns its length. Called once, before the first iteration.
size_t EmitPersistentModeSignal();

}  // namespace perennial

#endif  // THIRD_PARTY_PERENNIAL_PERSISTENT_MODE_SIGNAL_H_
