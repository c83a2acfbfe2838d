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

#include "./persistent_mode_signal.h"

#include <cstddef>

extern "C" __attribute__((used)) volatile const char
    perennial_persistent_mode_signal[] = "##SIG_AFL_PERSISTENT##";

namespace perennial {

static_assert(sizeof(perennial_persistent_mode_signal) ==
              sizeof(kPersistentModeSignal));

size_t EmitPersistentModeSignal() {
  size_t length = 0;
  while (perennial_persistent_mode_signal[length] != '\0') ++length;
  return length;
}

}  // namespace perennial
