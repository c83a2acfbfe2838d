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

// A harness with no linked-in target: the function under test lives in a
// native extension named by the `dso` and `symbol` harness flags. To run
// `void Parse(const char *)` from ext.so:
//   PERENNIAL_HARNESS_FLAGS=":dso=ext.so:symbol=Parse:convention=cstring:"

#include "./harness_interface.h"

int main(int argc, char **argv) {
  return PerennialHarnessMain(argc, argv, nullptr, nullptr);
}
