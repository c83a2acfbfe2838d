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

#include "./testing/abcd_target.h"

#include <stdlib.h>

#include <cstddef>
#include <cstdint>

namespace perennial {

int AbortOnAbcdPrefix(const uint8_t *data, size_t size) {
  if (size > 0 && data[0] == 'A') {
    if (size > 1 && data[1] == 'B') {
      if (size > 2 && data[2] == 'C') {
        if (size > 3 && data[3] == 'D') {
          abort();
        }
      }
    }
  }
  return 0;
}

}  // namespace perennial
