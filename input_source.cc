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

// WARNING: this code runs inside the fuzzed process. Please avoid Abseil
// and heavy STL usage here, in order to avoid creating new coverage edges
// in the binary.
#include "./input_source.h"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "./channel_protocol.h"
#include "./defs.h"

namespace perennial {

namespace {

// Records are read in chunks of this size, so that the buffer never grows
// past the bytes actually received.
constexpr size_t kReadChunkSize = 1 << 16;
// One raw read from a socket or a terminal returns at most this many bytes.
constexpr size_t kMaxRawReadSize = 1 << 20;

// Describes the errno of a failed read().
std::string ReadErrorDescription() {
  return std::string("read() failed: ") + strerror(errno);
}

// Returns the most bytes one read(2) from `fd` can return, capped at
// `max_len`.
size_t MaxReadSize(int fd, size_t max_len) {
  struct stat st = {};
  if (fstat(fd, &st) != 0) return std::min(max_len, kMaxRawReadSize);
  if (S_ISREG(st.st_mode)) {
    const off_t offset = lseek(fd, 0, SEEK_CUR);
    if (offset < 0 || offset > st.st_size) return 0;
    return std::min(max_len, static_cast<size_t>(st.st_size - offset));
  }
  if (S_ISFIFO(st.st_mode)) {
    const int pipe_size = fcntl(fd, F_GETPIPE_SZ);
    if (pipe_size > 0)
      return std::min(max_len, static_cast<size_t>(pipe_size));
  }
  return std::min(max_len, kMaxRawReadSize);
}

}  // namespace

InputStatus InputSource::Fault(std::string description) {
  fault_description_ = std::move(description);
  return InputStatus::kFault;
}

InputStatus StreamInputSource::Next(ByteArray &input) {
  switch (framing_) {
    case Framing::kLengthPrefixed:
      return NextLengthPrefixed(input);
    case Framing::kRaw:
      return NextRaw(input);
  }
  return Fault("unknown framing");
}

ssize_t StreamInputSource::ReadFully(uint8_t *data, size_t size) {
  size_t num_read = 0;
  while (num_read < size) {
    ssize_t ret = read(fd_, data + num_read, size - num_read);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    if (ret == 0) break;  // EOF.
    num_read += ret;
  }
  return num_read;
}

InputStatus StreamInputSource::NextLengthPrefixed(ByteArray &input) {
  input.clear();
  // Read the header: the 4-byte little-endian length of the record.
  uint8_t header[4];
  ssize_t num_read = ReadFully(header, sizeof(header));
  if (num_read < 0) return Fault(ReadErrorDescription());
  // EOF right at a record boundary: the engine closed the channel.
  if (num_read == 0) return InputStatus::kEndOfInput;
  if (num_read < static_cast<ssize_t>(sizeof(header)))
    return Fault("EOF inside a record header");
  const size_t record_size = static_cast<size_t>(header[0]) |
                             static_cast<size_t>(header[1]) << 8 |
                             static_cast<size_t>(header[2]) << 16 |
                             static_cast<size_t>(header[3]) << 24;

  // Read the part of the record that fits into max_len.
  const size_t size = std::min(record_size, max_len());
  while (input.size() < size) {
    const size_t offset = input.size();
    const size_t chunk = std::min(size - offset, kReadChunkSize);
    input.resize(offset + chunk);
    num_read = ReadFully(input.data() + offset, chunk);
    if (num_read < 0) {
      input.clear();
      return Fault(ReadErrorDescription());
    }
    if (static_cast<size_t>(num_read) != chunk) {
      input.clear();
      return Fault("EOF inside a record");
    }
  }

  // Discard the rest of an oversized record, so that the next record is
  // read from its header.
  size_t num_to_discard = record_size - size;
  uint8_t discard_buffer[4096];
  while (num_to_discard != 0) {
    const size_t chunk = std::min(num_to_discard, sizeof(discard_buffer));
    num_read = ReadFully(discard_buffer, chunk);
    if (num_read < 0) return Fault(ReadErrorDescription());
    if (static_cast<size_t>(num_read) != chunk) {
      input.clear();
      return Fault("EOF inside a record");
    }
    num_to_discard -= chunk;
  }
  return InputStatus::kInput;
}

InputStatus StreamInputSource::NextRaw(ByteArray &input) {
  input.resize(MaxReadSize(fd_, max_len()));
  ssize_t num_read = 0;
  do {
    num_read = read(fd_, input.data(), input.size());
  } while (num_read < 0 && errno == EINTR);
  if (num_read < 0) {
    input.clear();
    return Fault(ReadErrorDescription());
  }
  input.resize(num_read);
  // In raw framing an empty read can only mean EOF.
  if (num_read == 0) return InputStatus::kEndOfInput;
  return InputStatus::kInput;
}

InputStatus SharedMemoryInputSource::Next(ByteArray &input) {
  input.clear();
  auto blob = blobseq_.Read();
  if (!blob.IsValid()) {
    if (blobseq_.corrupted()) return Fault("malformed shared memory input");
    return InputStatus::kEndOfInput;
  }
  if (!channel_protocol::IsDataInput(blob))
    return Fault("unexpected blob tag in shared memory input");
  // Copy from the blob so that the target never touches the shared memory.
  const size_t size = std::min(blob.size, max_len());
  input.insert(input.end(), blob.data, blob.data + size);
  return InputStatus::kInput;
}

InputStatus FileListInputSource::Next(ByteArray &input) {
  input.clear();
  if (next_path_ == paths_.size()) return InputStatus::kEndOfInput;
  const std::string &path = paths_[next_path_++];
  FILE *file = fopen(path.c_str(), "rb");
  if (!file) return Fault("can't open the input file: " + path);
  struct stat st = {};
  if (fstat(fileno(file), &st) != 0) {
    fclose(file);
    return Fault("can't stat the input file: " + path);
  }
  // Regular files are read in one go. Anything else (e.g. a FIFO) is read in
  // chunks until EOF or max_len.
  const size_t size_hint =
      S_ISREG(st.st_mode) ? static_cast<size_t>(st.st_size) : max_len();
  const size_t size = std::min(size_hint, max_len());
  bool failed = false;
  while (input.size() < size) {
    const size_t offset = input.size();
    const size_t chunk = S_ISREG(st.st_mode)
                             ? size - offset
                             : std::min(size - offset, kReadChunkSize);
    input.resize(offset + chunk);
    const size_t num_read = fread(input.data() + offset, 1, chunk, file);
    input.resize(offset + num_read);
    if (num_read != chunk) {
      failed = ferror(file);
      break;
    }
  }
  fclose(file);
  if (failed) {
    input.clear();
    return Fault("can't read the input file: " + path);
  }
  return InputStatus::kInput;
}

}  // namespace perennial
