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

// The entry point of the persistent mode harness.
// Keep this header free of C++ types: it is the only interface between the
// harness library and a main() provided by the user.

#ifndef THIRD_PARTY_PERENNIAL_HARNESS_INTERFACE_H_
#define THIRD_PARTY_PERENNIAL_HARNESS_INTERFACE_H_

#include <cstddef>
#include <cstdint>

extern "C" {

using PerennialTestOneInputCallback = int (*)(const uint8_t *data, size_t size);
using PerennialInitializeCallback = int (*)(int *argc, char ***argv);

// Reads the configuration from the PERENNIAL_HARNESS_FLAGS env var, sets up
// the input channel and the target, and runs the persistent loop.
// Returns the process exit code: 0 if the budget was exhausted or the channel
// was closed, EX_CONFIG on a configuration error, EX_IOERR if the channel
// failed. Does not return if the target crashes.
//
// `test_one_input_cb` is the linked-in target. If it is nullptr, the target
// is loaded from the DSO named by the `dso` flag.
// `initialize_cb` (may be nullptr) is called once before the first iteration.
int PerennialHarnessMain(int argc, char **argv,
                         PerennialTestOneInputCallback test_one_input_cb,
                         PerennialInitializeCallback initialize_cb);

}  // extern "C"

#endif  // THIRD_PARTY_PERENNIAL_HARNESS_INTERFACE_H_
