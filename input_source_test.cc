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

#include "./input_source.h"

#include <fcntl.h>
#include <unistd.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "gtest/gtest.h"
#include "./channel_protocol.h"
#include "./defs.h"
#include "./harness_flags.h"
#include "./shared_memory_blob_sequence.h"
#include "./test_util.h"
#include "./util.h"

namespace perennial {
namespace {

// A pipe with everything the test wants to send already written into it and
// the write end closed. Small enough to fit into the pipe buffer.
class Pipe {
 public:
  explicit Pipe(const ByteArray &contents) {
    int fds[2];
    EXPECT_EQ(pipe(fds), 0);
    read_fd_ = fds[0];
    EXPECT_EQ(write(fds[1], contents.data(), contents.size()),
              static_cast<ssize_t>(contents.size()));
    close(fds[1]);
  }
  ~Pipe() { close(read_fd_); }
  int read_fd() const { return read_fd_; }

 private:
  int read_fd_ = -1;
};

// Appends a length-prefixed record with `data` to `stream`.
void AppendRecord(const ByteArray &data, ByteArray &stream) {
  const uint32_t size = data.size();
  for (int i = 0; i < 4; ++i) stream.push_back((size >> (8 * i)) & 0xFF);
  stream.insert(stream.end(), data.begin(), data.end());
}

TEST(StreamInputSource, LengthPrefixedRecords) {
  ByteArray stream;
  AppendRecord({'a', 'b', 'c'}, stream);
  AppendRecord({}, stream);
  AppendRecord({0, 0xFF}, stream);
  Pipe pipe(stream);
  StreamInputSource source(pipe.read_fd(), 100, Framing::kLengthPrefixed);

  ByteArray input = {'s', 't', 'a', 'l', 'e'};
  EXPECT_EQ(source.Next(input), InputStatus::kInput);
  EXPECT_EQ(input, ByteArray({'a', 'b', 'c'}));
  // An empty input is an input.
  EXPECT_EQ(source.Next(input), InputStatus::kInput);
  EXPECT_TRUE(input.empty());
  EXPECT_EQ(source.Next(input), InputStatus::kInput);
  EXPECT_EQ(input, ByteArray({0, 0xFF}));
  EXPECT_EQ(source.Next(input), InputStatus::kEndOfInput);
  // Stays closed.
  EXPECT_EQ(source.Next(input), InputStatus::kEndOfInput);
}

TEST(StreamInputSource, ExactMaxLenIsNotTruncated) {
  const ByteArray exact(8, 'x');
  ByteArray stream;
  AppendRecord(exact, stream);
  Pipe pipe(stream);
  StreamInputSource source(pipe.read_fd(), 8, Framing::kLengthPrefixed);
  ByteArray input;
  EXPECT_EQ(source.Next(input), InputStatus::kInput);
  EXPECT_EQ(input, exact);
}

TEST(StreamInputSource, OversizedRecordIsTruncatedAndStaysAligned) {
  ByteArray big(10000);
  for (size_t i = 0; i < big.size(); ++i) big[i] = i % 251;
  ByteArray stream;
  AppendRecord(big, stream);
  AppendRecord({'n', 'e', 'x', 't'}, stream);
  Pipe pipe(stream);
  StreamInputSource source(pipe.read_fd(), 16, Framing::kLengthPrefixed);

  ByteArray input;
  EXPECT_EQ(source.Next(input), InputStatus::kInput);
  EXPECT_EQ(input, ByteArray(big.begin(), big.begin() + 16));
  EXPECT_EQ(source.Next(input), InputStatus::kInput);
  EXPECT_EQ(input, ByteArray({'n', 'e', 'x', 't'}));
  EXPECT_EQ(source.Next(input), InputStatus::kEndOfInput);
}

TEST(StreamInputSource, HugeRecordHeaderWithLittleDataIsAFault) {
  // Claims a 4G-1 record, delivers 3 bytes.
  Pipe pipe({0xFF, 0xFF, 0xFF, 0xFF, 'a', 'b', 'c'});
  StreamInputSource source(pipe.read_fd(), kMaxLenLimit,
                           Framing::kLengthPrefixed);
  ByteArray input;
  EXPECT_EQ(source.Next(input), InputStatus::kFault);
  EXPECT_TRUE(input.empty());
}

TEST(StreamInputSource, TruncatedHeaderIsAFault) {
  Pipe pipe({3, 0});
  StreamInputSource source(pipe.read_fd(), 100, Framing::kLengthPrefixed);
  ByteArray input;
  EXPECT_EQ(source.Next(input), InputStatus::kFault);
  EXPECT_FALSE(source.fault_description().empty());
}

TEST(StreamInputSource, TruncatedRecordIsAFault) {
  ByteArray stream;
  AppendRecord({'a', 'b', 'c'}, stream);
  stream.pop_back();
  Pipe pipe(stream);
  StreamInputSource source(pipe.read_fd(), 100, Framing::kLengthPrefixed);
  ByteArray input;
  EXPECT_EQ(source.Next(input), InputStatus::kFault);
  EXPECT_TRUE(input.empty());
}

TEST(StreamInputSource, ReadErrorIsAFault) {
  // A write-only fd can't be read.
  ScopedTempDir temp_dir("input_source_test");
  const std::string path = temp_dir.GetFilePath("write_only");
  int fd = open(path.c_str(), O_WRONLY | O_CREAT, 0600);
  ASSERT_GE(fd, 0);
  StreamInputSource source(fd, 100, Framing::kRaw);
  ByteArray input;
  EXPECT_EQ(source.Next(input), InputStatus::kFault);
  EXPECT_NE(source.fault_description().find("read() failed"),
            std::string::npos);
  close(fd);
}

TEST(StreamInputSource, RawReadsOneChunk) {
  Pipe pipe({'1', '2', '3', '4', '5'});
  StreamInputSource source(pipe.read_fd(), 3, Framing::kRaw);
  ByteArray input;
  // At most max_len bytes per read.
  EXPECT_EQ(source.Next(input), InputStatus::kInput);
  EXPECT_EQ(input, ByteArray({'1', '2', '3'}));
  EXPECT_EQ(source.Next(input), InputStatus::kInput);
  EXPECT_EQ(input, ByteArray({'4', '5'}));
  EXPECT_EQ(source.Next(input), InputStatus::kEndOfInput);
  EXPECT_TRUE(input.empty());
}

TEST(SharedMemoryInputSource, ReadsDataBlobs) {
  const std::string name = ProcessAndThreadUniqueID("/input_source_test-");
  SharedMemoryBlobSequence engine_side(name.c_str(), 1000);
  const std::vector<ByteArray> inputs = {
      {'a'}, {}, {'1', '2', '3', '4', '5', '6'}};
  ASSERT_EQ(channel_protocol::WriteInputs(inputs, engine_side), 3);

  auto harness_side = SharedMemoryBlobSequence::OpenExisting(name.c_str());
  ASSERT_NE(harness_side, nullptr);
  SharedMemoryInputSource source(*harness_side, 4);
  ByteArray input;
  EXPECT_EQ(source.Next(input), InputStatus::kInput);
  EXPECT_EQ(input, ByteArray({'a'}));
  EXPECT_EQ(source.Next(input), InputStatus::kInput);
  EXPECT_TRUE(input.empty());
  // Truncated to max_len.
  EXPECT_EQ(source.Next(input), InputStatus::kInput);
  EXPECT_EQ(input, ByteArray({'1', '2', '3', '4'}));
  EXPECT_EQ(source.Next(input), InputStatus::kEndOfInput);
}

TEST(SharedMemoryInputSource, UnexpectedTagIsAFault) {
  const std::string name = ProcessAndThreadUniqueID("/input_source_test-");
  SharedMemoryBlobSequence engine_side(name.c_str(), 1000);
  ASSERT_TRUE(channel_protocol::WriteInputBegin(0, engine_side));

  auto harness_side = SharedMemoryBlobSequence::OpenExisting(name.c_str());
  ASSERT_NE(harness_side, nullptr);
  SharedMemoryInputSource source(*harness_side, 100);
  ByteArray input;
  EXPECT_EQ(source.Next(input), InputStatus::kFault);
  EXPECT_FALSE(source.fault_description().empty());
}

TEST(FileListInputSource, ReadsFilesInOrder) {
  ScopedTempDir temp_dir("input_source_test");
  const std::string path1 = temp_dir.GetFilePath("1");
  const std::string path2 = temp_dir.GetFilePath("2");
  WriteToLocalFile(path1, std::string_view("first"));
  WriteToLocalFile(path2, std::string_view("second"));

  FileListInputSource source({path2, path1}, 4);
  ByteArray input;
  EXPECT_EQ(source.Next(input), InputStatus::kInput);
  EXPECT_EQ(input, ByteArray({'s', 'e', 'c', 'o'}));
  EXPECT_EQ(source.Next(input), InputStatus::kInput);
  EXPECT_EQ(input, ByteArray({'f', 'i', 'r', 's'}));
  EXPECT_EQ(source.Next(input), InputStatus::kEndOfInput);
}

TEST(FileListInputSource, LargestMaxLen) {
  ScopedTempDir temp_dir("input_source_test_max_len");
  const std::string path = temp_dir.GetFilePath("1");
  WriteToLocalFile(path, std::string_view("abc"));
  FileListInputSource source({path, path}, kMaxLenLimit);
  ByteArray input;
  EXPECT_EQ(source.Next(input), InputStatus::kInput);
  EXPECT_EQ(input, ByteArray({'a', 'b', 'c'}));
  EXPECT_EQ(source.Next(input), InputStatus::kInput);
  EXPECT_EQ(input, ByteArray({'a', 'b', 'c'}));
  EXPECT_EQ(source.Next(input), InputStatus::kEndOfInput);
}

TEST(StreamInputSource, RawFramingWithTheLargestMaxLen) {
  Pipe pipe({'h', 'i'});
  StreamInputSource source(pipe.read_fd(), kMaxLenLimit, Framing::kRaw);
  ByteArray input;
  EXPECT_EQ(source.Next(input), InputStatus::kInput);
  EXPECT_EQ(input, ByteArray({'h', 'i'}));
  EXPECT_EQ(source.Next(input), InputStatus::kEndOfInput);

  ScopedTempDir temp_dir("input_source_test_raw_file");
  const std::string path = temp_dir.GetFilePath("stream");
  WriteToLocalFile(path, std::string_view("whole file"));
  const int fd = open(path.c_str(), O_RDONLY);
  ASSERT_GE(fd, 0);
  StreamInputSource file_source(fd, kMaxLenLimit, Framing::kRaw);
  EXPECT_EQ(file_source.Next(input), InputStatus::kInput);
  EXPECT_EQ(input.size(), 10);
  EXPECT_EQ(file_source.Next(input), InputStatus::kEndOfInput);
  close(fd);
}

TEST(FileListInputSource, MissingFileIsAFault) {
  FileListInputSource source({"/no/such/file"}, 100);
  ByteArray input;
  EXPECT_EQ(source.Next(input), InputStatus::kFault);
  EXPECT_NE(source.fault_description().find("/no/such/file"),
            std::string::npos);
}

}  // namespace
}  // namespace perennial
