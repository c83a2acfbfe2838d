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

#include "./util.h"

#include <openssl/sha.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>  // NOLINT(build/c++11)
#include <vector>

#include "absl/base/attributes.h"
#include "absl/base/const_init.h"
#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/span.h"
#include "./defs.h"
#include "./logging.h"

namespace perennial {

std::string Hash(absl::Span<const uint8_t> data) {
  uint8_t digest[SHA_DIGEST_LENGTH];
  SHA1(data.data(), data.size(), digest);
  static const char kHexDigits[] = "0123456789abcdef";
  std::string result;
  result.reserve(kHashLen);
  for (uint8_t byte : digest) {
    result.push_back(kHexDigits[byte >> 4]);
    result.push_back(kHexDigits[byte & 0xF]);
  }
  return result;
}

std::string Hash(std::string_view str) {
  static_assert(sizeof(decltype(str)::value_type) == sizeof(uint8_t));
  return Hash(absl::Span<const uint8_t>(
      reinterpret_cast<const uint8_t *>(str.data()), str.size()));
}

static_assert(SHA_DIGEST_LENGTH * 2 == kHashLen);

std::string AsString(const ByteArray &data, size_t max_len) {
  std::ostringstream out;
  size_t len = std::min(max_len, data.size());
  for (size_t i = 0; i < len; ++i) {
    const uint8_t ch = data[i];
    if (std::isprint(ch)) {
      out << static_cast<char>(ch);
    } else {
      out << "\\x" << std::uppercase << std::hex << static_cast<uint32_t>(ch)
          << std::dec;
    }
  }
  return out.str();
}

template <typename Container>
static void ReadFromLocalFile(std::string_view file_path, Container &data) {
  std::ifstream f(std::string{file_path}, std::ios::binary);
  CHECK(f) << "Failed to open local file: " << file_path;
  f.seekg(0, std::ios_base::end);
  size_t size = f.tellg();
  f.seekg(0, std::ios_base::beg);
  data.resize(size);
  f.read(reinterpret_cast<char *>(data.data()), size);
  CHECK(f) << "Failed to read from local file: " << file_path;
}

void ReadFromLocalFile(std::string_view file_path, std::string &data) {
  ReadFromLocalFile<std::string>(file_path, data);
}
void ReadFromLocalFile(std::string_view file_path, ByteArray &data) {
  ReadFromLocalFile<ByteArray>(file_path, data);
}

void WriteToLocalFile(std::string_view file_path,
                      absl::Span<const uint8_t> data) {
  std::ofstream f(std::string{file_path}, std::ios::binary);
  CHECK(f) << "Failed to open local file: " << file_path;
  f.write(reinterpret_cast<const char *>(data.data()), data.size());
  CHECK(f) << "Failed to write to local file: " << file_path;
}

void WriteToLocalFile(std::string_view file_path, std::string_view data) {
  static_assert(sizeof(decltype(data)::value_type) == sizeof(uint8_t));
  WriteToLocalFile(file_path, absl::Span<const uint8_t>(
      reinterpret_cast<const uint8_t *>(data.data()), data.size()));
}

std::string WriteToLocalHashedFileInDir(std::string_view dir_path,
                                        absl::Span<const uint8_t> data) {
  if (dir_path.empty()) return "";
  std::string file_path = std::filesystem::path(dir_path).append(Hash(data));
  WriteToLocalFile(file_path, data);
  return file_path;
}

std::vector<std::string> ListLocalFilesInDir(std::string_view dir_path) {
  std::vector<std::string> paths;
  std::error_code error;
  for (const auto &entry :
       std::filesystem::directory_iterator(dir_path, error)) {
    if (entry.is_regular_file()) paths.push_back(entry.path().string());
  }
  CHECK(!error) << "Failed to list dir: " << dir_path << ": "
                << error.message();
  std::sort(paths.begin(), paths.end());
  return paths;
}

std::string ProcessAndThreadUniqueID(std::string_view prefix) {
  // operator << is the only way to serialize std::this_thread::get_id().
  std::ostringstream oss;
  oss << prefix << getpid() << "-" << std::this_thread::get_id();
  return oss.str();
}

std::string TemporaryLocalDirPath() {
  const char *TMPDIR = getenv("TMPDIR");
  std::string tmp = TMPDIR ? TMPDIR : "/tmp";
  return std::filesystem::path(tmp).append(
      ProcessAndThreadUniqueID("perennial-"));
}

// We need to maintain a global set of dirs that CreateLocalDirRemovedAtExit()
// was called with, so that we can remove all these dirs at exit.
ABSL_CONST_INIT static absl::Mutex dirs_to_delete_at_exit_mutex{
    absl::kConstInit};
static std::vector<std::string> *dirs_to_delete_at_exit
    ABSL_GUARDED_BY(dirs_to_delete_at_exit_mutex);

// Atexit handler added by CreateLocalDirRemovedAtExit().
// Deletes all dirs in dirs_to_delete_at_exit.
static void RemoveDirsAtExit() {
  absl::MutexLock lock(&dirs_to_delete_at_exit_mutex);
  for (auto &dir : *dirs_to_delete_at_exit) {
    std::filesystem::remove_all(dir);
  }
}

void CreateLocalDirRemovedAtExit(std::string_view path) {
  // Safe-guard against removing dirs not created by TemporaryLocalDirPath().
  CHECK_NE(path.find("/perennial-"), std::string::npos);
  // Create the dir.
  std::filesystem::remove_all(path);
  std::filesystem::create_directories(path);
  // Add to dirs_to_delete_at_exit.
  absl::MutexLock lock(&dirs_to_delete_at_exit_mutex);
  if (!dirs_to_delete_at_exit) {
    dirs_to_delete_at_exit = new std::vector<std::string>();
    atexit(&RemoveDirsAtExit);
  }
  dirs_to_delete_at_exit->emplace_back(path);
}

static std::atomic<int> requested_exit_code(EXIT_SUCCESS);

void RequestEarlyExit(int exit_code) {
  CHECK_NE(exit_code, EXIT_SUCCESS);
  requested_exit_code = exit_code;
}
bool EarlyExitRequested() { return requested_exit_code != EXIT_SUCCESS; }
int ExitCode() { return requested_exit_code; }

}  // namespace perennial
