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

#ifndef THIRD_PARTY_PERENNIAL_COMMAND_H_
#define THIRD_PARTY_PERENNIAL_COMMAND_H_

#include <sys/types.h>

#include <string>
#include <string_view>
#include <vector>

#include "absl/time/time.h"

namespace perennial {
class Command final {
 public:
  // Move-constructible only.
  Command(const Command& other) = delete;
  Command& operator=(const Command& other) = delete;
  Command& operator=(Command&& other) = delete;
  Command(Command&& other) = default;

  // Constructs a command:
  // `path`: path to the binary.
  // `args`: arguments.
  // `env`: environment variables/values (in the form "KEY=VALUE").
  // `out`: stdout redirect path (empty means none).
  // `err`: stderr redirect path (empty means none).
  // `timeout`: kill the command if it runs longer than this.
  // `in`: stdin redirect path (empty means none).
  // If `out` == `err` and both are non-empty, stdout/stderr are combined.
  explicit Command(std::string_view path, std::vector<std::string> args = {},
                   std::vector<std::string> env = {}, std::string_view out = "",
                   std::string_view err = "",
                   absl::Duration timeout = absl::InfiniteDuration(),
                   std::string_view in = "");

  // Returns a string representing the command, e.g. like this
  // "ENV1=VAL1 path arg1 arg2 < in > out 2>& err"
  std::string ToString() const;
  // Executes the command, returns the exit status.
  // If the command exited, returns its exit code. Otherwise (it was killed by
  // a signal) returns the raw wait status, see WTERMSIG().
  // Can be called more than once.
  // If interrupted, may call RequestEarlyExit().
  int Execute();

  // True iff the most recent Execute() killed the command on timeout.
  bool timed_out() const { return timed_out_; }

 private:
  // Returns the line passed to /bin/sh: the command with its redirections,
  // replacing the shell process.
  std::string ShellCommandLine() const;
  // Waits for `pid` to finish, killing its process group on timeout.
  // Returns the wait status.
  int WaitWithTimeout(pid_t pid);

  const std::string path_;
  const std::vector<std::string> args_;
  const std::vector<std::string> env_;
  const std::string out_;
  const std::string err_;
  const absl::Duration timeout_;
  const std::string in_;
  const std::string command_line_ = ToString();
  bool timed_out_ = false;
};

}  // namespace perennial

#endif  // THIRD_PARTY_PERENNIAL_COMMAND_H_
