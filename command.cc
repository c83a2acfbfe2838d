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

#include "./command.h"

#include <errno.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "./logging.h"
#include "./util.h"

namespace perennial {
namespace {

inline constexpr std::string_view kCommandLineSeparator(" \\\n");
// How often a command with a timeout is polled for completion.
constexpr absl::Duration kPollInterval = absl::Milliseconds(10);

}  // namespace

Command::Command(std::string_view path, std::vector<std::string> args,
                 std::vector<std::string> env, std::string_view out,
                 std::string_view err, absl::Duration timeout,
                 std::string_view in)
    : path_(path),
      args_(std::move(args)),
      env_(std::move(env)),
      out_(out),
      err_(err),
      timeout_(timeout),
      in_(in) {}

std::string Command::ToString() const {
  std::vector<std::string> ss;
  ss.insert(ss.cend(), env_.cbegin(), env_.cend());
  ss.push_back(path_);
  ss.insert(ss.cend(), args_.cbegin(), args_.cend());
  if (!in_.empty()) {
    ss.emplace_back(absl::StrCat("< ", in_));
  }
  if (!out_.empty()) {
    ss.emplace_back(absl::StrCat("> ", out_));
  }
  if (!err_.empty()) {
    ss.emplace_back(out_ != err_ ? absl::StrCat("2> ", err_) : "2>&1");
  }
  return absl::StrJoin(ss, kCommandLineSeparator);
}

std::string Command::ShellCommandLine() const {
  // The env vars are set in the child directly, see Execute().
  std::vector<std::string> ss = {"exec", path_};
  ss.insert(ss.cend(), args_.cbegin(), args_.cend());
  if (!in_.empty()) ss.emplace_back(absl::StrCat("< ", in_));
  if (!out_.empty()) ss.emplace_back(absl::StrCat("> ", out_));
  if (!err_.empty()) {
    ss.emplace_back(out_ != err_ ? absl::StrCat("2> ", err_) : "2>&1");
  }
  return absl::StrJoin(ss, " ");
}

int Command::WaitWithTimeout(pid_t pid) {
  int status = 0;
  if (timeout_ == absl::InfiniteDuration()) {
    while (waitpid(pid, &status, 0) < 0) {
      PCHECK(errno == EINTR) << VV(pid) << VV(command_line_);
    }
    return status;
  }
  const absl::Time deadline = absl::Now() + timeout_;
  while (true) {
    const pid_t ret = waitpid(pid, &status, WNOHANG);
    if (ret == pid) return status;
    PCHECK(ret == 0 || errno == EINTR) << VV(pid) << VV(command_line_);
    if (absl::Now() >= deadline) break;
    absl::SleepFor(kPollInterval);
  }
  LOG(INFO) << "Timeout of " << timeout_ << " exceeded, killing: "
            << command_line_;
  timed_out_ = true;
  // The command runs in its own process group: kill it with its children.
  kill(-pid, SIGKILL);
  while (waitpid(pid, &status, 0) < 0) {
    PCHECK(errno == EINTR) << VV(pid) << VV(command_line_);
  }
  return status;
}

int Command::Execute() {
  timed_out_ = false;
  const std::string shell_command_line = ShellCommandLine();
  const pid_t pid = fork();
  PCHECK(pid >= 0) << "fork() failed: " << command_line_;
  if (pid == 0) {
    // Child.
    setpgid(0, 0);
    for (const auto& key_value : env_) {
      putenv(const_cast<char*>(key_value.c_str()));
    }
    execl("/bin/sh", "sh", "-c", shell_command_line.c_str(), nullptr);
    _exit(127);
  }
  // Also set in the parent, so that a kill on timeout can not race with the
  // child's own setpgid().
  setpgid(pid, pid);
  const int exit_code = WaitWithTimeout(pid);
  if (WIFSIGNALED(exit_code) && (WTERMSIG(exit_code) == SIGINT))
    RequestEarlyExit(EXIT_FAILURE);
  if (WIFEXITED(exit_code)) return WEXITSTATUS(exit_code);
  return exit_code;
}

}  // namespace perennial
