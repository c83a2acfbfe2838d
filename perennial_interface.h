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

#ifndef THIRD_PARTY_PERENNIAL_PERENNIAL_INTERFACE_H_
#define THIRD_PARTY_PERENNIAL_PERENNIAL_INTERFACE_H_

#include "./environment.h"

namespace perennial {

// Runs the corpus from env.input_dir through env.binary and saves the
// crashing inputs under env.output_dir.
// Returns EXIT_SUCCESS if every input was executed (crashes included),
// EXIT_FAILURE on a bad environment or if the harness failed.
int PerennialMain(const Environment &env);

}  // namespace perennial

#endif  // THIRD_PARTY_PERENNIAL_PERENNIAL_INTERFACE_H_
