/*
 * Copyright 2021 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef V8_V8_PLATFORM_INITIALIZER_H_
#define V8_V8_PLATFORM_INITIALIZER_H_

namespace scriptbox::v8 {

// V8 may be initialized only once per process. Constructing any number of
// V8PlatformInitializer objects initializes the shared platform on first use.
// The engine is configured without WebAssembly and without string-to-code
// evaluation before initialization, so every isolate created afterwards
// inherits those restrictions.
class V8PlatformInitializer {
 public:
  V8PlatformInitializer();
};

}  // namespace scriptbox::v8

#endif  // V8_V8_PLATFORM_INITIALIZER_H_
