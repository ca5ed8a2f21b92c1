// Copyright 2021 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "v8/v8_platform_initializer.h"

#include <memory>

#include "libplatform/libplatform.h"
#include "v8.h"

namespace scriptbox::v8 {
namespace {

constexpr char kEngineFlags[] =
    "--no-expose-wasm --disallow-code-generation-from-strings "
    "--single-threaded-gc";

class Platform {
 public:
  Platform() {
    ::v8::V8::SetFlagsFromString(kEngineFlags);
    platform_ = ::v8::platform::NewDefaultPlatform();
    ::v8::V8::InitializePlatform(platform_.get());
    ::v8::V8::Initialize();
  }

 private:
  std::unique_ptr<::v8::Platform> platform_;
};

}  // namespace

V8PlatformInitializer::V8PlatformInitializer() {
  // Never destroyed: V8 cannot be re-initialized after disposal.
  static Platform* platform = new Platform();
  (void)platform;
}

}  // namespace scriptbox::v8
