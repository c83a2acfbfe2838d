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
#include "./target.h"

#include <dlfcn.h>
#include <string.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "./defs.h"
#include "./harness_flags.h"

namespace perennial {

// Every Invoke() copies the input into a fresh heap allocation of the exact
// size (plus the terminator, where the convention has one). This way a
// sanitizer reports the target reading past the end of the input.

void BytesTarget::Invoke(const ByteArray &input) {
  std::unique_ptr<uint8_t[]> data(new uint8_t[input.size()]);
  if (!input.empty()) memcpy(data.get(), input.data(), input.size());
  callback_(data.get(), input.size());
}

void CStringTarget::Invoke(const ByteArray &input) {
  std::unique_ptr<char[]> str(new char[input.size() + 1]);
  if (!input.empty()) memcpy(str.get(), input.data(), input.size());
  str[input.size()] = '\0';
  callback_(str.get());
}

void StringAndSizeTarget::Invoke(const ByteArray &input) {
  std::unique_ptr<char[]> str(new char[input.size() + 1]);
  if (!input.empty()) memcpy(str.get(), input.data(), input.size());
  str[input.size()] = '\0';
  callback_(str.get(), input.size());
}

std::unique_ptr<DsoTarget> DsoTarget::Load(const std::string &dso_path,
                                           const std::string &symbol,
                                           const std::string &init_symbol,
                                           CallingConvention convention,
                                           std::string &error) {
  // RTLD_NOW: unresolved symbols fail here, as a configuration error, and not
  // in the first iteration.
  void *handle = dlopen(dso_path.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (!handle) {
    error = std::string("dlopen() failed: ") + dlerror();
    return nullptr;
  }
  void *target_sym = dlsym(handle, symbol.c_str());
  if (!target_sym) {
    error = "target symbol not found: " + symbol;
    dlclose(handle);
    return nullptr;
  }
  InitializeCallback initialize_cb = nullptr;
  if (!init_symbol.empty()) {
    void *init_sym = dlsym(handle, init_symbol.c_str());
    if (!init_sym) {
      error = "init symbol not found: " + init_symbol;
      dlclose(handle);
      return nullptr;
    }
    initialize_cb = reinterpret_cast<InitializeCallback>(init_sym);
  }

  std::unique_ptr<Target> target;
  switch (convention) {
    case CallingConvention::kBytes:
      target = std::make_unique<BytesTarget>(
          reinterpret_cast<BytesCallback>(target_sym));
      break;
    case CallingConvention::kCString:
      target = std::make_unique<CStringTarget>(
          reinterpret_cast<CStringCallback>(target_sym));
      break;
    case CallingConvention::kStringAndSize:
      target = std::make_unique<StringAndSizeTarget>(
          reinterpret_cast<StringAndSizeCallback>(target_sym));
      break;
  }
  if (!target) {
    error = "unknown calling convention";
    dlclose(handle);
    return nullptr;
  }
  // Can't use std::make_unique with a private CTOR.
  return std::unique_ptr<DsoTarget>(
      new DsoTarget(handle, std::move(target), initialize_cb));
}

DsoTarget::~DsoTarget() {
  target_.reset();
  dlclose(handle_);
}

void DsoTarget::Initialize(int *argc, char ***argv) {
  if (initialize_cb_) initialize_cb_(argc, argv);
}

}  // namespace perennial
