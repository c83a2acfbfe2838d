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

#include "./channel_protocol.h"

#include <string.h>

#include <cstddef>
#include <cstdint>
#include <vector>

#include "./defs.h"
#include "./shared_memory_blob_sequence.h"

namespace perennial::channel_protocol {

namespace {

bool WriteIndex(SharedMemoryBlobSequence::Blob::size_and_tag_type tag,
                size_t index, SharedMemoryBlobSequence &blobseq) {
  uint64_t value = index;
  return blobseq.Write(
      {tag, sizeof(value), reinterpret_cast<const uint8_t *>(&value)});
}

// Returns false if `blob` does not hold exactly one index.
bool ReadIndex(const SharedMemoryBlobSequence::Blob &blob, size_t &index) {
  uint64_t value = 0;
  if (blob.size != sizeof(value)) return false;
  memcpy(&value, blob.data, sizeof(value));
  index = value;
  return true;
}

}  // namespace

size_t WriteInputs(const std::vector<ByteArray> &inputs,
                   SharedMemoryBlobSequence &blobseq) {
  size_t num_written = 0;
  for (const auto &input : inputs) {
    if (!blobseq.Write({kTagDataInput, input.size(), input.data()})) break;
    ++num_written;
  }
  return num_written;
}

bool IsDataInput(const SharedMemoryBlobSequence::Blob &blob) {
  return blob.tag == kTagDataInput;
}

bool WriteInputBegin(size_t index, SharedMemoryBlobSequence &blobseq) {
  return WriteIndex(kTagInputBegin, index, blobseq);
}

bool WriteInputEnd(size_t index, SharedMemoryBlobSequence &blobseq) {
  return WriteIndex(kTagInputEnd, index, blobseq);
}

Progress ReadProgress(SharedMemoryBlobSequence &blobseq) {
  Progress progress;
  while (true) {
    auto blob = blobseq.Read();
    if (!blob.IsValid()) break;
    size_t index = 0;
    if (!ReadIndex(blob, index)) {
      progress.malformed = true;
      break;
    }
    // Begin and end blobs must alternate, with consecutive indices.
    if (blob.tag == kTagInputBegin && index == progress.num_begun &&
        progress.num_begun == progress.num_finished) {
      ++progress.num_begun;
    } else if (blob.tag == kTagInputEnd && index == progress.num_finished &&
               progress.num_begun == progress.num_finished + 1) {
      ++progress.num_finished;
    } else {
      progress.malformed = true;
      break;
    }
  }
  if (blobseq.corrupted()) progress.malformed = true;
  return progress;
}

}  // namespace perennial::channel_protocol
