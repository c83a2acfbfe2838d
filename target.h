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

#ifndef THIRD_PARTY_PERENNIAL_TARGET_H_
#define THIRD_PARTY_PERENNIAL_TARGET_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "./defs.h"
#include "./harness_flags.h"

namespace perennial {

// Target calling conventions.
// This is the header-less interface of libFuzzer, see
// https://llvm.org/docs/LibFuzzer.html.
using BytesCallback = int (*)(const uint8_t *data, size_t size);
// What a native extension typically receives from an interpreter's FFI.
using CStringCallback = void (*)(const char *str);
using StringAndSizeCallback = void (*)(const char *str, size_t size);
// Called once before the first iteration, like LLVMFuzzerInitialize.
using InitializeCallback = int (*)(int *argc, char ***argv);

// Delivers one input to the function under test.
//
// The input is passed as is: never validated, never truncated. Targets keep
// no state between calls. The return value of the function under test is
// ignored: the only outcomes are "returned" and "the process died", and the
// latter is deliberately not intercepted here.
class Target {
 public:
  virtual ~Target() = default;
  virtual void Invoke(const ByteArray &input) = 0;
};

// int (*)(const uint8_t *data, size_t size).
class BytesTarget : public Target {
 public:
  explicit BytesTarget(BytesCallback callback) : callback_(callback) {}
  void Invoke(const ByteArray &input) override;

 private:
  const BytesCallback callback_;
};

// void (*)(const char *str): the bytes followed by a NUL terminator.
// Embedded NUL bytes are passed through; it is up to the callee how to
// interpret them.
class CStringTarget : public Target {
 public:
  explicit CStringTarget(CStringCallback callback) : callback_(callback) {}
  void Invoke(const ByteArray &input) override;

 private:
  const CStringCallback callback_;
};

// void (*)(const char *str, size_t size): NUL-terminated and sized.
class StringAndSizeTarget : public Target {
 public:
  explicit StringAndSizeTarget(StringAndSizeCallback callback)
      : callback_(callback) {}
  void Invoke(const ByteArray &input) override;

 private:
  const StringAndSizeCallback callback_;
};

// A target that lives in a native extension loaded at runtime.
// Owns the dlopen() handle; the library stays loaded for the lifetime of this
// object.
class DsoTarget : public Target {
 public:
  // Loads `dso_path`, resolves `symbol` and wraps it according to
  // `convention`. If `init_symbol` is not empty, resolves it as an
  // InitializeCallback, see Initialize().
  // Returns nullptr and sets `error` if the library or a symbol is missing.
  static std::unique_ptr<DsoTarget> Load(const std::string &dso_path,
                                         const std::string &symbol,
                                         const std::string &init_symbol,
                                         CallingConvention convention,
                                         std::string &error);

  DsoTarget(const DsoTarget &) = delete;
  DsoTarget &operator=(const DsoTarget &) = delete;
  ~DsoTarget() override;

  // Calls the initializer, if any, with the harness's argc/argv.
  void Initialize(int *argc, char ***argv);

  void Invoke(const ByteArray &input) override { target_->Invoke(input); }

 private:
  DsoTarget(void *handle, std::unique_ptr<Target> target,
            InitializeCallback initialize_cb)
      : handle_(handle),
        target_(std::move(target)),
        initialize_cb_(initialize_cb) {}

  void *handle_;
  std::unique_ptr<Target> target_;
  InitializeCallback initialize_cb_;
};

}  // namespace perennial

#endif  // THIRD_PARTY_PERENNIAL_TARGET_H_
