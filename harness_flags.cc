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

#include "./harness_flags.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include <cstdint>
#include <string>

#include "./defs.h"

namespace perennial {

bool HarnessFlags::GetStringFlag(const char *flag, std::string &value) const {
  // Extract "value" from ":flag=value:".
  const size_t beg = flags_.find(flag);
  if (beg == std::string::npos) return false;
  const size_t value_beg = beg + strlen(flag);
  const size_t end = flags_.find(':', value_beg);
  if (end == std::string::npos) return false;
  value = flags_.substr(value_beg, end - value_beg);
  return true;
}

bool HarnessFlags::GetIntFlag(const char *flag, uint64_t default_value,
                              uint64_t &value) const {
  std::string str;
  if (!GetStringFlag(flag, str)) {
    value = default_value;
    return true;
  }
  if (str.empty() || str[0] < '0' || str[0] > '9') return false;
  errno = 0;
  char *end = nullptr;
  const unsigned long long parsed = strtoull(str.c_str(), &end, 10);  // NOLINT
  if (errno != 0 || *end != '\0') return false;
  value = parsed;
  return true;
}

namespace {

bool ParseChannel(const std::string &name, Channel &channel) {
  if (name == "stdin") {
    channel = Channel::kStdin;
  } else if (name == "fd") {
    channel = Channel::kFd;
  } else if (name == "shmem") {
    channel = Channel::kShmem;
  } else if (name == "files") {
    channel = Channel::kFiles;
  } else {
    return false;
  }
  return true;
}

bool ParseFraming(const std::string &name, Framing &framing) {
  if (name == "length_prefixed") {
    framing = Framing::kLengthPrefixed;
  } else if (name == "raw") {
    framing = Framing::kRaw;
  } else {
    return false;
  }
  return true;
}

bool ParseConvention(const std::string &name, CallingConvention &convention) {
  if (name == "bytes") {
    convention = CallingConvention::kBytes;
  } else if (name == "cstring") {
    convention = CallingConvention::kCString;
  } else if (name == "string_and_size") {
    convention = CallingConvention::kStringAndSize;
  } else {
    return false;
  }
  return true;
}

}  // namespace

bool ParseHarnessConfig(const char *flags_str, HarnessConfig &config,
                        std::string &error) {
  const HarnessFlags flags(flags_str);
  config = HarnessConfig();

  // :channel=stdin|fd|shmem|files: where the inputs come from.
  std::string value;
  if (flags.GetStringFlag(":channel=", value) &&
      !ParseChannel(value, config.channel)) {
    error = "unknown channel: " + value;
    return false;
  }
  // :framing=length_prefixed|raw: how test cases are delimited on a stream.
  if (flags.GetStringFlag(":framing=", value) &&
      !ParseFraming(value, config.framing)) {
    error = "unknown framing: " + value;
    return false;
  }
  // :convention=bytes|cstring|string_and_size: see CallingConvention.
  if (flags.GetStringFlag(":convention=", value) &&
      !ParseConvention(value, config.convention)) {
    error = "unknown calling convention: " + value;
    return false;
  }

  uint64_t number = 0;
  // :input_fd=N: the stream to read when channel=fd.
  if (!flags.GetIntFlag(":input_fd=", 0, number) || number > INT32_MAX) {
    error = "bad input_fd";
    return false;
  }
  config.input_fd = static_cast<int>(number);
  if (config.channel == Channel::kStdin) config.input_fd = 0;

  // :max_len=N: the cap on one input's size.
  if (!flags.GetIntFlag(":max_len=", kDefaultMaxInputSize, number) ||
      number == 0 || number > kMaxLenLimit) {
    error = "bad max_len, must be a positive number not above " +
            std::to_string(kMaxLenLimit);
    return false;
  }
  config.max_len = number;

  // :iterations=N: the iteration budget of this process.
  if (!flags.GetIntFlag(":iterations=", kDefaultIterationBudget, number) ||
      number == 0) {
    error = "bad iterations, must be a positive number";
    return false;
  }
  config.iterations = number;

  // :address_space_limit_mb=N: if not zero, sets RLIMIT_AS.
  if (!flags.GetIntFlag(":address_space_limit_mb=", 0, number) ||
      number > kAddressSpaceLimitMbLimit) {
    error = "bad address_space_limit_mb";
    return false;
  }
  config.address_space_limit_mb = number;

  // :shmem_in=NAME:shmem_out=NAME: the shared memory regions (channel=shmem).
  // shmem_out is optional; without it there is no provenance reporting.
  flags.GetStringFlag(":shmem_in=", config.shmem_in);
  flags.GetStringFlag(":shmem_out=", config.shmem_out);
  if (config.channel == Channel::kShmem && config.shmem_in.empty()) {
    error = "channel=shmem requires shmem_in";
    return false;
  }

  // :dso=PATH:symbol=NAME:init_symbol=NAME: a target loaded at runtime.
  flags.GetStringFlag(":dso=", config.dso);
  flags.GetStringFlag(":symbol=", config.symbol);
  flags.GetStringFlag(":init_symbol=", config.init_symbol);
  if (!config.dso.empty() && config.symbol.empty()) {
    error = "dso requires symbol";
    return false;
  }
  if (config.dso.empty() &&
      (!config.symbol.empty() || !config.init_symbol.empty())) {
    error = "symbol and init_symbol require dso";
    return false;
  }
  return true;
}

}  // namespace perennial
