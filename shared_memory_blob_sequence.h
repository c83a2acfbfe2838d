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

#ifndef THIRD_PARTY_PERENNIAL_SHARED_MEMORY_BLOB_SEQUENCE_H_
#define THIRD_PARTY_PERENNIAL_SHARED_MEMORY_BLOB_SEQUENCE_H_

#include <cstddef>
#include <cstdint>
#include <memory>

namespace perennial {

// SharedMemoryBlobSequence is a sequence of blobs stored in a named shared
// memory region (shm_open). One process writes blobs, another process opens
// the same region by name and reads them in the same order.
//
// Layout: {tag, size, data[size]}, {tag, size, data[size]}, ...
// The sequence is terminated by a {0, 0} header, or by the end of the region.
//
// The engine creates the region (and owns its name), the harness opens it.
// The harness side never CHECK-fails on a malformed region: an abort there
// would be indistinguishable from a crash of the target. Instead, Read()
// returns an invalid blob and corrupted() becomes true.
class SharedMemoryBlobSequence {
 public:
  struct Blob {
    using size_and_tag_type = size_t;
    Blob(size_and_tag_type tag, size_and_tag_type size, const uint8_t *data)
        : tag(tag), size(size), data(data) {}
    Blob() = default;  // Constructs an invalid Blob.
    bool IsValid() const { return tag != 0; }

    size_and_tag_type tag = 0;
    size_and_tag_type size = 0;
    const uint8_t *data = nullptr;
  };

  // Creates a new shared memory region `name` of `size` bytes.
  // The region is unlinked in the DTOR.
  // CHECK-fails on any error: this is only called by the engine.
  SharedMemoryBlobSequence(const char *name, size_t size);

  // Opens an existing shared memory region `name`, created by another process.
  // Returns nullptr on failure, errno is preserved.
  static std::unique_ptr<SharedMemoryBlobSequence> OpenExisting(
      const char *name);

  SharedMemoryBlobSequence(const SharedMemoryBlobSequence &) = delete;
  SharedMemoryBlobSequence &operator=(const SharedMemoryBlobSequence &) =
      delete;

  // Unmaps, closes, and (if created by this object) unlinks the region.
  ~SharedMemoryBlobSequence();

  // Writes the contents of `blob` to the region.
  // Returns true on success, false if there is not enough space left.
  // Must not be mixed with Read() between two Reset() calls.
  bool Write(Blob blob);

  // Reads the next blob. Returns an invalid blob at the end of the sequence
  // or if the region is malformed; in the latter case corrupted() is true.
  // The returned data points into the shared region and remains valid until
  // the region is overwritten.
  Blob Read();

  // Rewinds to the beginning, making the sequence readable or writable again.
  void Reset();

  // Reset()s and empties the sequence, discarding blobs written by either
  // process.
  void Clear();

  // True iff Read() has detected a malformed region.
  bool corrupted() const { return corrupted_; }
  size_t size() const { return size_; }

 private:
  SharedMemoryBlobSequence() = default;
  // mmap()s the region into data_. Returns false on failure.
  bool MmapData();

  char *name_to_unlink_ = nullptr;  // Set only when created by this object.
  int fd_ = -1;
  uint8_t *data_ = nullptr;
  size_t size_ = 0;
  size_t offset_ = 0;
  bool had_reads_after_reset_ = false;
  bool had_writes_after_reset_ = false;
  bool corrupted_ = false;
};

}  // namespace perennial

#endif  // THIRD_PARTY_PERENNIAL_SHARED_MEMORY_BLOB_SEQUENCE_H_
