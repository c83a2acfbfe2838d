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

// The shared memory protocol between the engine and the harness.
//
// The engine fills the input sequence with data blobs (one per test case)
// and launches the harness. The harness consumes one data blob per
// iteration. If the engine also passes an output sequence, the harness
// writes an InputBegin blob right before invoking the target on an input
// and an InputEnd blob right after the target returns. If the harness dies,
// the engine reads the output sequence to find out which input was running.

#ifndef THIRD_PARTY_PERENNIAL_CHANNEL_PROTOCOL_H_
#define THIRD_PARTY_PERENNIAL_CHANNEL_PROTOCOL_H_

#include <cstddef>
#include <vector>

#include "./defs.h"
#include "./shared_memory_blob_sequence.h"

namespace perennial::channel_protocol {

// Blob tags. Zero is reserved for the end of the sequence.
inline constexpr SharedMemoryBlobSequence::Blob::size_and_tag_type
    kTagDataInput = 1;
inline constexpr SharedMemoryBlobSequence::Blob::size_and_tag_type
    kTagInputBegin = 2;
inline constexpr SharedMemoryBlobSequence::Blob::size_and_tag_type
    kTagInputEnd = 3;

// Engine side. Writes `inputs` to `blobseq`, one data blob per input.
// Returns the number of inputs written: fewer than inputs.size() if the
// region is too small.
size_t WriteInputs(const std::vector<ByteArray> &inputs,
                   SharedMemoryBlobSequence &blobseq);

// Returns true iff `blob` carries a test case.
bool IsDataInput(const SharedMemoryBlobSequence::Blob &blob);

// Harness side. Marks the beginning/end of the execution of input #`index`.
// Return false if `blobseq` is full.
bool WriteInputBegin(size_t index, SharedMemoryBlobSequence &blobseq);
bool WriteInputEnd(size_t index, SharedMemoryBlobSequence &blobseq);

// What the engine learns from the output sequence after the harness exits.
struct Progress {
  // Number of inputs the target was invoked on.
  size_t num_begun = 0;
  // Number of inputs on which the target returned.
  size_t num_finished = 0;
  // True if the sequence was malformed or out of order.
  bool malformed = false;

  // True if the harness died while the target was running an input.
  bool DiedInsideTarget() const { return num_begun == num_finished + 1; }
};

// Engine side. Reads all begin/end blobs from `blobseq`.
Progress ReadProgress(SharedMemoryBlobSequence &blobseq);

}  // namespace perennial::channel_protocol

#endif  // THIRD_PARTY_PERENNIAL_CHANNEL_PROTOCOL_H_
