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

#include "./shared_memory_blob_sequence.h"

#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdint>
#include <memory>

#include "absl/log/check.h"

namespace perennial {

namespace {
// Size of the {tag, size} header that precedes every blob.
constexpr size_t kHeaderSize = sizeof(SharedMemoryBlobSequence::Blob::tag) +
                               sizeof(SharedMemoryBlobSequence::Blob::size);
}  // namespace

SharedMemoryBlobSequence::SharedMemoryBlobSequence(const char *name,
                                                   size_t size)
    : size_(size) {
  CHECK_GE(size, kHeaderSize) << "Size too small";
  fd_ = shm_open(name, O_RDWR | O_CREAT | O_EXCL, S_IRUSR | S_IWUSR);
  PCHECK(fd_ >= 0) << "shm_open() failed: " << name;
  name_to_unlink_ = strdup(name);  // Using raw C strings to avoid dependencies.
  PCHECK(ftruncate(fd_, size_) == 0) << "ftruncate() failed";
  PCHECK(MmapData()) << "mmap() failed";
  // An empty sequence: {0, 0} header at offset 0.
  memset(data_, 0, kHeaderSize);
}

std::unique_ptr<SharedMemoryBlobSequence>
SharedMemoryBlobSequence::OpenExisting(const char *name) {
  // Can't use std::make_unique with a private CTOR.
  std::unique_ptr<SharedMemoryBlobSequence> result(
      new SharedMemoryBlobSequence());
  result->fd_ = shm_open(name, O_RDWR, 0);
  if (result->fd_ < 0) return nullptr;
  struct stat statbuf = {};
  if (fstat(result->fd_, &statbuf) != 0) return nullptr;
  result->size_ = statbuf.st_size;
  if (result->size_ < kHeaderSize) return nullptr;
  if (!result->MmapData()) return nullptr;
  return result;
}

bool SharedMemoryBlobSequence::MmapData() {
  void *data =
      mmap(nullptr, size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
  if (data == MAP_FAILED) return false;
  data_ = static_cast<uint8_t *>(data);
  return true;
}

SharedMemoryBlobSequence::~SharedMemoryBlobSequence() {
  if (data_ != nullptr) munmap(data_, size_);
  if (name_to_unlink_) {
    shm_unlink(name_to_unlink_);
    free(name_to_unlink_);
  }
  if (fd_ >= 0) close(fd_);
}

void SharedMemoryBlobSequence::Reset() {
  offset_ = 0;
  had_reads_after_reset_ = false;
  had_writes_after_reset_ = false;
  corrupted_ = false;
}

void SharedMemoryBlobSequence::Clear() {
  Reset();
  memset(data_, 0, kHeaderSize);
}

bool SharedMemoryBlobSequence::Write(Blob blob) {
  CHECK(blob.IsValid()) << "blob.tag must not be zero";
  CHECK(!had_reads_after_reset_) << "Had reads after reset";
  had_writes_after_reset_ = true;
  if (offset_ + kHeaderSize + blob.size > size_) return false;
  // Write tag.
  memcpy(data_ + offset_, &blob.tag, sizeof(blob.tag));
  offset_ += sizeof(blob.tag);
  // Write size.
  memcpy(data_ + offset_, &blob.size, sizeof(blob.size));
  offset_ += sizeof(blob.size);
  // Write data.
  if (blob.size != 0) memcpy(data_ + offset_, blob.data, blob.size);
  offset_ += blob.size;
  if (offset_ + kHeaderSize <= size_) {
    // Write zero tag/size to data_+offset_ but don't change the offset.
    // This is required to overwrite any stale bits in data_.
    memset(data_ + offset_, 0, kHeaderSize);
  }
  return true;
}

SharedMemoryBlobSequence::Blob SharedMemoryBlobSequence::Read() {
  CHECK(!had_writes_after_reset_) << "Had writes after reset";
  had_reads_after_reset_ = true;
  if (corrupted_) return {};
  if (offset_ + kHeaderSize > size_) return {};
  // Read blob_tag.
  Blob::size_and_tag_type blob_tag = 0;
  memcpy(&blob_tag, data_ + offset_, sizeof(blob_tag));
  // Read blob_size.
  Blob::size_and_tag_type blob_size = 0;
  memcpy(&blob_size, data_ + offset_ + sizeof(blob_tag), sizeof(blob_size));
  if (blob_tag == 0 && blob_size == 0) return {};  // End of sequence.
  if (blob_tag == 0 || blob_size > size_ - offset_ - kHeaderSize) {
    corrupted_ = true;
    return {};
  }
  offset_ += kHeaderSize;
  Blob result{blob_tag, blob_size, data_ + offset_};
  offset_ += blob_size;
  return result;
}

}  // namespace perennial
