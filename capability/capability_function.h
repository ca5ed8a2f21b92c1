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

#ifndef CAPABILITY_CAPABILITY_FUNCTION_H_
#define CAPABILITY_CAPABILITY_FUNCTION_H_

#include <functional>
#include <utility>

#include "absl/status/statusor.h"
#include "context/execution_context.h"
#include "google/protobuf/struct.pb.h"

namespace scriptbox::capability {

// Host-side implementation of a capability. Runs outside the sandbox with the
// platform's own credentials; scripts reach it only through the registry.
class CapabilityFunction {
 public:
  CapabilityFunction() = default;
  virtual ~CapabilityFunction() = default;

  // Invokes the capability. `input` has already been checked against the
  // capability's input schema. May block on network I/O.
  virtual absl::StatusOr<google::protobuf::Value> Call(
      const google::protobuf::Value& input,
      const ::scriptbox::context::ExecutionContext& context) const = 0;

  CapabilityFunction(const CapabilityFunction&) = delete;
  CapabilityFunction& operator=(const CapabilityFunction&) = delete;
};

// Binds a capability to an in-process callable.
class LambdaCapabilityFunction : public CapabilityFunction {
 public:
  using Function = std::function<absl::StatusOr<google::protobuf::Value>(
      const google::protobuf::Value&,
      const ::scriptbox::context::ExecutionContext&)>;

  explicit LambdaCapabilityFunction(Function function)
      : function_(std::move(function)) {}

  absl::StatusOr<google::protobuf::Value> Call(
      const google::protobuf::Value& input,
      const ::scriptbox::context::ExecutionContext& context) const override {
    return function_(input, context);
  }

 private:
  const Function function_;
};

}  // namespace scriptbox::capability

#endif  // CAPABILITY_CAPABILITY_FUNCTION_H_
