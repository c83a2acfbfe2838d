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

#ifndef THIRD_PARTY_PERENNIAL_INPUT_SOURCE_H_
#define THIRD_PARTY_PERENNIAL_INPUT_SOURCE_H_

#include <sys/types.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "./defs.h"
#include "./harness_flags.h"
#include "./shared_memory_blob_sequence.h"

namespace perennial {

// The result of one attempt to obtain an input.
enum class InputStatus {
  kInput,       // `input` holds the next test case (possibly empty).
  kEndOfInput,  // The channel is closed, there will be no more inputs.
  kFault,       // The channel failed. See InputSource::fault_description().
};

// Obtains one test case per call from the external engine.
// Implementations block until the next test case is available or the channel
// is closed. They never keep bytes between calls: all bytes of a test case
// are delivered in the call that consumed them.
class InputSource {
 public:
  virtual ~InputSource() = default;

  // Replaces the contents of `input` with the next test case, at most
  // max_len() bytes. Longer test cases are truncated to max_len() bytes.
  virtual InputStatus Next(ByteArray &input) = 0;

  // The description of the most recent kFault.
  const std::string &fault_description() const { return fault_description_; }
  size_t max_len() const { return max_len_; }

 protected:
  explicit InputSource(size_t max_len) : max_len_(max_len) {}

  // Sets the fault description and returns kFault.
  InputStatus Fault(std::string description);

 private:
  const size_t max_len_;
  std::string fault_description_;
};

// Reads test cases from a POSIX file descriptor. Does not own `fd`.
// The buffer only grows with the bytes actually read, whatever max_len is.
class StreamInputSource : public InputSource {
 public:
  StreamInputSource(int fd, size_t max_len, Framing framing)
      : InputSource(max_len), fd_(fd), framing_(framing) {}

  InputStatus Next(ByteArray &input) override;

 private:
  InputStatus NextLengthPrefixed(ByteArray &input);
  InputStatus NextRaw(ByteArray &input);

  // Reads exactly `size` bytes into `data`, retrying short reads and EINTR.
  // Returns the number of bytes read, which is less than `size` only at EOF,
  // or -1 on a read error.
  ssize_t ReadFully(uint8_t *data, size_t size);

  const int fd_;
  const Framing framing_;
};

// Reads test cases from a shared memory blob sequence filled by the engine.
class SharedMemoryInputSource : public InputSource {
 public:
  SharedMemoryInputSource(SharedMemoryBlobSequence &blobseq, size_t max_len)
      : InputSource(max_len), blobseq_(blobseq) {}

  InputStatus Next(ByteArray &input) override;

 private:
  SharedMemoryBlobSequence &blobseq_;
};

// Reads one file per call, in the order given. Used to reproduce crashes
// from files saved by the engine.
class FileListInputSource : public InputSource {
 public:
  FileListInputSource(std::vector<std::string> paths, size_t max_len)
      : InputSource(max_len), paths_(std::move(paths)) {}

  InputStatus Next(ByteArray &input) override;

 private:
  const std::vector<std::string> paths_;
  size_t next_path_ = 0;
};

}  // namespace perennial

#endif  // THIRD_PARTY_PERENNIAL_INPUT_SOURCE_H_
