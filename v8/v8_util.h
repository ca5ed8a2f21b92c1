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

#ifndef V8_V8_UTIL_H_
#define V8_V8_UTIL_H_

#include <cstddef>
#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "v8.h"

namespace scriptbox::v8 {

template <typename T>
absl::StatusOr<::v8::Local<T>> ToLocalChecked(absl::string_view error_message,
                                              ::v8::MaybeLocal<T> maybe_value) {
  if (maybe_value.IsEmpty()) {
    return absl::Status(absl::StatusCode::kInternal, error_message);
  }
  return maybe_value.ToLocalChecked();
}

template <typename T>
absl::StatusOr<::v8::Local<T>> ToLocalChecked(
    ::v8::MaybeLocal<T> maybe_value) {
  return ToLocalChecked("Missing expected V8 value.", maybe_value);
}

absl::StatusOr<::v8::Local<::v8::String>> NewString(::v8::Isolate* isolate,
                                                    absl::string_view str);

// UTF-8 rendering of `value` as `String(value)` would produce it.
std::string ToStdString(::v8::Isolate* isolate, ::v8::Local<::v8::Value> value);

// "line N: <message>" for the exception caught by `try_catch`, or the bare
// message when V8 has no location for it.
std::string DescribeException(::v8::Local<::v8::Context> context,
                              const ::v8::TryCatch& try_catch);

// Owns a v8::Isolate together with its array buffer allocator.
class IsolateHolder {
 public:
  // `heap_limit_bytes` of zero keeps V8's default heap limits.
  explicit IsolateHolder(size_t heap_limit_bytes = 0);
  ~IsolateHolder();

  IsolateHolder(const IsolateHolder&) = delete;
  IsolateHolder& operator=(const IsolateHolder&) = delete;

  ::v8::Isolate* get() const { return isolate_; }

 private:
  std::unique_ptr<::v8::ArrayBuffer::Allocator> allocator_;
  ::v8::Isolate* isolate_;
};

}  // namespace scriptbox::v8

#endif  // V8_V8_UTIL_H_
