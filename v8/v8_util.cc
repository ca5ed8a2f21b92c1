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

#include "v8/v8_util.h"

#include "absl/strings/str_cat.h"

namespace scriptbox::v8 {

absl::StatusOr<::v8::Local<::v8::String>> NewString(::v8::Isolate* isolate,
                                                    absl::string_view str) {
  return ToLocalChecked(::v8::String::NewFromUtf8(
      isolate, str.data(), ::v8::NewStringType::kNormal,
      static_cast<int>(str.size())));
}

std::string ToStdString(::v8::Isolate* isolate,
                        ::v8::Local<::v8::Value> value) {
  ::v8::String::Utf8Value utf8(isolate, value);
  if (*utf8 == nullptr) {
    return "";
  }
  return std::string(*utf8, utf8.length());
}

std::string DescribeException(::v8::Local<::v8::Context> context,
                              const ::v8::TryCatch& try_catch) {
  ::v8::Isolate* isolate = context->GetIsolate();
  ::v8::Local<::v8::Message> message = try_catch.Message();
  if (message.IsEmpty()) {
    return try_catch.HasCaught() ? ToStdString(isolate, try_catch.Exception())
                                 : "Unknown error";
  }
  const std::string text = ToStdString(isolate, message->Get());
  const ::v8::Maybe<int> line = message->GetLineNumber(context);
  if (line.IsNothing()) {
    return text;
  }
  return absl::StrCat("line ", line.FromJust(), ": ", text);
}

IsolateHolder::IsolateHolder(size_t heap_limit_bytes)
    : allocator_(::v8::ArrayBuffer::Allocator::NewDefaultAllocator()) {
  ::v8::Isolate::CreateParams create_params;
  create_params.array_buffer_allocator = allocator_.get();
  if (heap_limit_bytes > 0) {
    create_params.constraints.ConfigureDefaultsFromHeapSize(0,
                                                            heap_limit_bytes);
  }
  isolate_ = ::v8::Isolate::New(create_params);
}

IsolateHolder::~IsolateHolder() { isolate_->Dispose(); }

}  // namespace scriptbox::v8
