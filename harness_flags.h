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

#ifndef THIRD_PARTY_PERENNIAL_HARNESS_FLAGS_H_
#define THIRD_PARTY_PERENNIAL_HARNESS_FLAGS_H_

#include <cstddef>
#include <cstdint>
#include <string>

namespace perennial {

// The harness reads flags from a dedicated env var, PERENNIAL_HARNESS_FLAGS.
// We don't use flags passed via argv so that argv can be passed to the target
// initializer (and, in `files` mode, list the inputs) w/o filtering.
// The flags are separated with ':' on both sides, i.e. like this:
// PERENNIAL_HARNESS_FLAGS=":flag1:flag2=value:". This keeps the parsing code
// extremely simple.
inline constexpr char kHarnessFlagsEnvVar[] = "PERENNIAL_HARNESS_FLAGS";

// Raw access to a flags string.
class HarnessFlags {
 public:
  // `flags` may be nullptr, meaning "no flags".
  explicit HarnessFlags(const char *flags) : flags_(flags ? flags : "") {}

  // If a ":flag=value:" pair is present, sets `value` and returns true.
  // Typical usage: pass ":some_flag=".
  bool GetStringFlag(const char *flag, std::string &value) const;

  // Same as above, for unsigned decimal values. If the flag is absent, sets
  // `value` to `default_value`. Returns false iff the flag is present but its
  // value is not a number.
  bool GetIntFlag(const char *flag, uint64_t default_value,
                  uint64_t &value) const;

 private:
  std::string flags_;
};

// Where the inputs come from.
enum class Channel {
  kStdin,  // A byte stream on fd 0.
  kFd,     // A byte stream on `input_fd`.
  kShmem,  // A shared memory blob sequence named `shmem_in`.
  kFiles,  // Files named in argv[1:], one per iteration.
};

// How test cases are delimited on a byte stream.
enum class Framing {
  kLengthPrefixed,  // 4-byte little-endian length, then the bytes.
  kRaw,             // One read(2) per test case.
};

// How the bytes are handed to a target loaded from a DSO.
enum class CallingConvention {
  kBytes,          // int (*)(const uint8_t *data, size_t size)
  kCString,        // void (*)(const char *str)
  kStringAndSize,  // void (*)(const char *str, size_t size)
};

// The largest accepted max_len: a length-prefixed record can't be longer.
inline constexpr uint64_t kMaxLenLimit = UINT32_MAX;
// The largest accepted address_space_limit_mb: larger values overflow bytes.
inline constexpr uint64_t kAddressSpaceLimitMbLimit = SIZE_MAX >> 20;

// Harness configuration, derived from the flags. The flags are documented
// next to their parsing code in harness_flags.cc.
struct HarnessConfig {
  Channel channel = Channel::kStdin;
  int input_fd = 0;
  Framing framing = Framing::kLengthPrefixed;
  size_t max_len = 0;
  size_t iterations = 0;
  std::string shmem_in;
  std::string shmem_out;
  std::string dso;
  std::string symbol;
  std::string init_symbol;
  CallingConvention convention = CallingConvention::kBytes;
  size_t address_space_limit_mb = 0;
};

// Parses `flags` (may be nullptr) into `config`.
// Returns true on success. On failure returns false and sets `error` to a
// human-readable description: the caller treats it as a configuration error.
bool ParseHarnessConfig(const char *flags, HarnessConfig &config,
                        std::string &error);

}  // namespace perennial

#endif  // THIRD_PARTY_PERENNIAL_HARNESS_FLAGS_H_
