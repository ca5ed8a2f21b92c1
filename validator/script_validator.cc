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

#include "validator/script_validator.h"

#include <algorithm>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "capability/import_path.h"
#include "spdlog/spdlog.h"
#include "util/status_macros.h"
#include "v8.h"
#include "v8/v8_util.h"
#include "validator/pattern_scan.h"
#include "validator/script_lexer.h"
#include "validator/source_rescan.h"

namespace scriptbox::validator {
namespace {

constexpr char kResourceName[] = "script.mjs";

ValidationResult Reject(ValidationResult::Stage stage,
                        std::string diagnostic) {
  ValidationResult result;
  result.set_ok(false);
  result.set_stage(stage);
  result.add_diagnostics(std::move(diagnostic));
  spdlog::info("Script rejected at {} stage: {}",
               ValidationResult::Stage_Name(stage), result.diagnostics(0));
  return result;
}

// Compiles `source` as a module in a throwaway isolate and returns the
// specifiers of its static imports. A syntax error is reported as
// InvalidArgument carrying V8's message.
absl::StatusOr<std::vector<std::string>> CompileAndListImports(
    absl::string_view source) {
  scriptbox::v8::IsolateHolder holder;
  ::v8::Isolate* isolate = holder.get();
  ::v8::Isolate::Scope isolate_scope(isolate);
  ::v8::HandleScope handle_scope(isolate);
  ::v8::Local<::v8::Context> context = ::v8::Context::New(isolate);
  ::v8::Context::Scope context_scope(context);

  ASSIGN_OR_RETURN(::v8::Local<::v8::String> source_string,
                   scriptbox::v8::NewString(isolate, source));
  ASSIGN_OR_RETURN(::v8::Local<::v8::String> resource_name,
                   scriptbox::v8::NewString(isolate, kResourceName));
  ::v8::ScriptOrigin origin(isolate, resource_name, 0, 0, false, -1,
                            ::v8::Local<::v8::Value>(), false, false,
                            /*is_module=*/true);
  ::v8::ScriptCompiler::Source compiler_source(source_string, origin);

  ::v8::TryCatch try_catch(isolate);
  ::v8::MaybeLocal<::v8::Module> maybe_module =
      ::v8::ScriptCompiler::CompileModule(isolate, &compiler_source);
  if (maybe_module.IsEmpty()) {
    return absl::InvalidArgumentError(
        scriptbox::v8::DescribeException(context, try_catch));
  }
  ::v8::Local<::v8::Module> module = maybe_module.ToLocalChecked();

  std::vector<std::string> specifiers;
  ::v8::Local<::v8::FixedArray> requests = module->GetModuleRequests();
  for (int i = 0; i < requests->Length(); ++i) {
    ::v8::Local<::v8::ModuleRequest> request =
        requests->Get(context, i).As<::v8::ModuleRequest>();
    specifiers.push_back(
        scriptbox::v8::ToStdString(isolate, request->GetSpecifier()));
  }
  return specifiers;
}

}  // namespace

ScriptValidator::ScriptValidator(const ValidatorOptions& options)
    : options_(options) {}

ValidationResult ScriptValidator::Validate(
    absl::string_view source,
    const absl::flat_hash_set<std::string>& allowed_capabilities) const {
  if (source.size() > options_.max_source_bytes) {
    return Reject(ValidationResult::SYNTAX,
                  absl::StrCat("Source is ", source.size(),
                               " bytes; the limit is ",
                               options_.max_source_bytes, " bytes."));
  }

  absl::StatusOr<std::vector<std::string>> specifiers =
      CompileAndListImports(source);
  if (!specifiers.ok()) {
    return Reject(ValidationResult::SYNTAX,
                  std::string(specifiers.status().message()));
  }

  ValidationResult result;
  for (const std::string& specifier : *specifiers) {
    std::string canonical = capability::CanonicalImportPath(specifier);
    if (!capability::IsRuntimeModule(canonical) &&
        !allowed_capabilities.contains(canonical)) {
      return Reject(ValidationResult::IMPORTS,
                    absl::StrCat("Import '", specifier,
                                 "' is not an allowed capability or runtime "
                                 "module."));
    }
    if (std::find(result.imports().begin(), result.imports().end(),
                  canonical) == result.imports().end()) {
      result.add_imports(std::move(canonical));
    }
  }

  absl::StatusOr<std::vector<Token>> tokens = Tokenize(source);
  if (!tokens.ok()) {
    return Reject(ValidationResult::PATTERNS,
                  std::string(tokens.status().message()));
  }
  if (absl::optional<PatternMatch> match = FindDeniedPattern(*tokens)) {
    return Reject(ValidationResult::PATTERNS,
                  absl::StrCat("line ", match->line, ": '", match->construct,
                               "' is not allowed (", match->pattern_class,
                               ")."));
  }

  if (absl::optional<std::string> word = FindBannedWord(source)) {
    return Reject(ValidationResult::FULLSCAN,
                  absl::StrCat("Source contains the banned identifier '",
                               *word, "' after decoding escapes and joining "
                               "string literals."));
  }

  result.set_ok(true);
  result.set_stage(ValidationResult::FULLSCAN);
  return result;
}

}  // namespace scriptbox::validator
