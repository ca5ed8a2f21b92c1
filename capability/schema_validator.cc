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

#include "capability/schema_validator.h"

#include <cmath>
#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/substitute.h"
#include "google/protobuf/util/message_differencer.h"
#include "util/status_macros.h"

namespace scriptbox::capability {
namespace {

using ::google::protobuf::ListValue;
using ::google::protobuf::Struct;
using ::google::protobuf::Value;
using ::google::protobuf::util::MessageDifferencer;

const Value* Keyword(const Struct& schema, absl::string_view name) {
  const auto it = schema.fields().find(std::string(name));
  return it == schema.fields().end() ? nullptr : &it->second;
}

absl::string_view KindName(const Value& value) {
  switch (value.kind_case()) {
    case Value::kNullValue:
      return "null";
    case Value::kNumberValue:
      return "number";
    case Value::kStringValue:
      return "string";
    case Value::kBoolValue:
      return "boolean";
    case Value::kStructValue:
      return "object";
    case Value::kListValue:
      return "array";
    default:
      return "undefined";
  }
}

bool MatchesType(const Value& value, absl::string_view type) {
  if (type == "integer") {
    return value.kind_case() == Value::kNumberValue &&
           std::trunc(value.number_value()) == value.number_value();
  }
  return KindName(value) == type;
}

size_t CodePointCount(absl::string_view text) {
  size_t count = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

absl::Status Violation(absl::string_view path, absl::string_view message) {
  return absl::InvalidArgumentError(absl::StrCat(path, ": ", message));
}

absl::Status CheckType(const Value& value, const Value& type_keyword,
                       absl::string_view path) {
  std::vector<std::string> accepted;
  if (type_keyword.kind_case() == Value::kStringValue) {
    accepted.push_back(type_keyword.string_value());
  } else if (type_keyword.kind_case() == Value::kListValue) {
    for (const Value& type : type_keyword.list_value().values()) {
      accepted.push_back(type.string_value());
    }
  }
  for (const std::string& type : accepted) {
    if (MatchesType(value, type)) {
      return absl::OkStatus();
    }
  }
  if (accepted.empty()) {
    return absl::OkStatus();
  }
  return Violation(path, absl::Substitute("expected $0, got $1",
                                          absl::StrJoin(accepted, " or "),
                                          KindName(value)));
}

absl::Status CheckEnum(const Value& value, const ListValue& allowed,
                       absl::string_view path) {
  for (const Value& candidate : allowed.values()) {
    if (MessageDifferencer::Equals(candidate, value)) {
      return absl::OkStatus();
    }
  }
  return Violation(path, "value is not one of the allowed values");
}

absl::Status ValidateValue(const Value& value, const Struct& schema,
                           const std::string& path);

absl::Status CheckObject(const Struct& object, const Struct& schema,
                         const std::string& path) {
  if (const Value* required = Keyword(schema, "required")) {
    for (const Value& name : required->list_value().values()) {
      if (!object.fields().contains(name.string_value())) {
        return Violation(path, absl::StrCat("missing required property '",
                                            name.string_value(), "'"));
      }
    }
  }
  const Value* properties = Keyword(schema, "properties");
  const Value* additional = Keyword(schema, "additionalProperties");
  const bool closed = additional != nullptr &&
                      additional->kind_case() == Value::kBoolValue &&
                      !additional->bool_value();
  for (const auto& [name, field] : object.fields()) {
    const Struct* field_schema = nullptr;
    if (properties != nullptr) {
      const auto it = properties->struct_value().fields().find(name);
      if (it != properties->struct_value().fields().end()) {
        field_schema = &it->second.struct_value();
      }
    }
    if (field_schema == nullptr) {
      if (closed) {
        return Violation(path,
                         absl::StrCat("unexpected property '", name, "'"));
      }
      continue;
    }
    RETURN_IF_ERROR(
        ValidateValue(field, *field_schema, absl::StrCat(path, ".", name)));
  }
  return absl::OkStatus();
}

absl::Status CheckArray(const ListValue& list, const Struct& schema,
                        const std::string& path) {
  const int size = list.values_size();
  if (const Value* min_items = Keyword(schema, "minItems");
      min_items != nullptr && size < min_items->number_value()) {
    return Violation(path, absl::Substitute("expected at least $0 items",
                                            min_items->number_value()));
  }
  if (const Value* max_items = Keyword(schema, "maxItems");
      max_items != nullptr && size > max_items->number_value()) {
    return Violation(path, absl::Substitute("expected at most $0 items",
                                            max_items->number_value()));
  }
  if (const Value* items = Keyword(schema, "items");
      items != nullptr && items->kind_case() == Value::kStructValue) {
    for (int i = 0; i < size; ++i) {
      RETURN_IF_ERROR(ValidateValue(list.values(i), items->struct_value(),
                                    absl::StrCat(path, "[", i, "]")));
    }
  }
  return absl::OkStatus();
}

absl::Status CheckString(absl::string_view text, const Struct& schema,
                         absl::string_view path) {
  const size_t length = CodePointCount(text);
  if (const Value* min_length = Keyword(schema, "minLength");
      min_length != nullptr && length < min_length->number_value()) {
    return Violation(path, absl::Substitute("shorter than $0 characters",
                                            min_length->number_value()));
  }
  if (const Value* max_length = Keyword(schema, "maxLength");
      max_length != nullptr && length > max_length->number_value()) {
    return Violation(path, absl::Substitute("longer than $0 characters",
                                            max_length->number_value()));
  }
  return absl::OkStatus();
}

absl::Status CheckNumber(double number, const Struct& schema,
                         absl::string_view path) {
  if (const Value* minimum = Keyword(schema, "minimum");
      minimum != nullptr && number < minimum->number_value()) {
    return Violation(path, absl::Substitute("must be at least $0",
                                            minimum->number_value()));
  }
  if (const Value* maximum = Keyword(schema, "maximum");
      maximum != nullptr && number > maximum->number_value()) {
    return Violation(path, absl::Substitute("must be at most $0",
                                            maximum->number_value()));
  }
  return absl::OkStatus();
}

absl::Status ValidateValue(const Value& value, const Struct& schema,
                           const std::string& path) {
  if (const Value* type = Keyword(schema, "type")) {
    RETURN_IF_ERROR(CheckType(value, *type, path));
  }
  if (const Value* allowed = Keyword(schema, "enum")) {
    RETURN_IF_ERROR(CheckEnum(value, allowed->list_value(), path));
  }
  switch (value.kind_case()) {
    case Value::kStructValue:
      return CheckObject(value.struct_value(), schema, path);
    case Value::kListValue:
      return CheckArray(value.list_value(), schema, path);
    case Value::kStringValue:
      return CheckString(value.string_value(), schema, path);
    case Value::kNumberValue:
      return CheckNumber(value.number_value(), schema, path);
    default:
      return absl::OkStatus();
  }
}

}  // namespace

absl::Status ValidateAgainstSchema(const Value& value, const Struct& schema,
                                   absl::string_view root) {
  return ValidateValue(value, schema, std::string(root));
}

}  // namespace scriptbox::capability
