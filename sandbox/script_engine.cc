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

#include "sandbox/script_engine.h"

#include <algorithm>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "capability/import_path.h"
#include "sandbox/runtime_modules.h"
#include "sandboxed_api/util/file_helpers.h"
#include "sandboxed_api/util/fileops.h"
#include "sandboxed_api/util/path.h"
#include "util/status_macros.h"
#include "v8.h"
#include "v8/v8_util.h"

namespace scriptbox::sandbox {
namespace {

using ::scriptbox::v8::NewString;
using ::scriptbox::v8::ToLocalChecked;
using ::scriptbox::v8::ToStdString;

constexpr int kEvaluationSlot = 1;
constexpr char kScriptResourceName[] = "script.mjs";

void ThrowError(::v8::Isolate* isolate, absl::string_view message) {
  absl::StatusOr<::v8::Local<::v8::String>> text = NewString(isolate, message);
  if (text.ok()) {
    isolate->ThrowException(::v8::Exception::Error(*text));
  }
}

// Rejects names that could leave the scratch directory.
absl::StatusOr<std::string> ScratchPath(const std::string& scratch_dir,
                                        absl::string_view name) {
  if (name.empty() || name == "." || name == ".." ||
      absl::StrContains(name, '/') || absl::StrContains(name, '\0')) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid scratch file name '", name, "'"));
  }
  return sapi::file::JoinPath(scratch_dir, name);
}

// State of one module evaluation. Must be destroyed before its isolate.
class Evaluation {
 public:
  Evaluation(const ScriptSpec& spec, CapabilityChannel* channel,
             std::ostream* out, std::ostream* err, ::v8::Isolate* isolate)
      : spec_(spec), channel_(channel), out_(out), err_(err),
        isolate_(isolate) {
    for (const auto& binding : spec.capabilities()) {
      export_names_[binding.import_path()] = binding.export_name();
    }
  }

  Evaluation(const Evaluation&) = delete;
  Evaluation& operator=(const Evaluation&) = delete;

  RunnerExitCode Run();

 private:
  static Evaluation* From(::v8::Local<::v8::Context> context) {
    return static_cast<Evaluation*>(
        context->GetAlignedPointerFromEmbedderData(kEvaluationSlot));
  }

  static size_t NearHeapLimit(void* data, size_t current_heap_limit,
                              size_t initial_heap_limit);
  static ::v8::MaybeLocal<::v8::Module> ResolveModule(
      ::v8::Local<::v8::Context> context, ::v8::Local<::v8::String> specifier,
      ::v8::Local<::v8::FixedArray> import_assertions,
      ::v8::Local<::v8::Module> referrer);
  static ::v8::MaybeLocal<::v8::Value> EvaluateSyntheticModule(
      ::v8::Local<::v8::Context> context, ::v8::Local<::v8::Module> module);

  static void ConsoleOut(const ::v8::FunctionCallbackInfo<::v8::Value>& info);
  static void ConsoleErr(const ::v8::FunctionCallbackInfo<::v8::Value>& info);
  static void CallCapability(
      const ::v8::FunctionCallbackInfo<::v8::Value>& info);
  static void WriteScratchFile(
      const ::v8::FunctionCallbackInfo<::v8::Value>& info);
  static void ReadScratchFile(
      const ::v8::FunctionCallbackInfo<::v8::Value>& info);
  static void ListScratchFiles(
      const ::v8::FunctionCallbackInfo<::v8::Value>& info);

  absl::Status InstallConsole(::v8::Local<::v8::Context> context);
  absl::StatusOr<::v8::Local<::v8::Module>> CompileModule(
      absl::string_view resource_name, absl::string_view source);
  ::v8::MaybeLocal<::v8::Module> Resolve(::v8::Local<::v8::Context> context,
                                         const std::string& specifier);
  absl::StatusOr<::v8::Local<::v8::Module>> NewSyntheticModule(
      const std::string& path, const std::vector<std::string>& exports);
  absl::Status SetExport(::v8::Local<::v8::Context> context,
                         ::v8::Local<::v8::Module> module,
                         absl::string_view name,
                         ::v8::FunctionCallback callback,
                         ::v8::Local<::v8::Value> data);
  std::string FormatArguments(
      const ::v8::FunctionCallbackInfo<::v8::Value>& info);
  std::string ValueToText(::v8::Local<::v8::Context> context,
                          ::v8::Local<::v8::Value> value);
  RunnerExitCode ReportUncaught(::v8::Local<::v8::Context> context,
                                ::v8::Local<::v8::Value> exception);

  const ScriptSpec& spec_;
  CapabilityChannel* const channel_;
  std::ostream* const out_;
  std::ostream* const err_;
  ::v8::Isolate* const isolate_;

  // Capability import path -> exported function name.
  absl::flat_hash_map<std::string, std::string> export_names_;
  // Canonical import path -> module, so each module is created once.
  absl::flat_hash_map<std::string, ::v8::Global<::v8::Module>> modules_;
  // Identity hash of a synthetic module -> its canonical import path.
  absl::flat_hash_map<int, std::string> synthetic_paths_;
  bool out_of_memory_ = false;
};

size_t Evaluation::NearHeapLimit(void* data, size_t current_heap_limit,
                                 size_t initial_heap_limit) {
  auto* evaluation = static_cast<Evaluation*>(data);
  evaluation->out_of_memory_ = true;
  evaluation->isolate_->TerminateExecution();
  // Some headroom so that termination can unwind.
  return current_heap_limit + current_heap_limit / 4;
}

RunnerExitCode Evaluation::Run() {
  ::v8::Isolate::Scope isolate_scope(isolate_);
  ::v8::HandleScope handle_scope(isolate_);
  isolate_->AddNearHeapLimitCallback(&Evaluation::NearHeapLimit, this);
  ::v8::Local<::v8::Context> context = ::v8::Context::New(isolate_);
  ::v8::Context::Scope context_scope(context);
  context->SetAlignedPointerInEmbedderData(kEvaluationSlot, this);

  if (absl::Status status = InstallConsole(context); !status.ok()) {
    *err_ << "Runner fault: " << status.message() << "\n";
    return kRunnerFault;
  }

  ::v8::TryCatch try_catch(isolate_);
  absl::StatusOr<::v8::Local<::v8::Module>> module =
      CompileModule(kScriptResourceName, spec_.source_code());
  if (!module.ok()) {
    return ReportUncaught(context, try_catch.Exception());
  }
  if ((*module)
          ->InstantiateModule(context, &Evaluation::ResolveModule)
          .IsNothing()) {
    return ReportUncaught(context, try_catch.Exception());
  }
  ::v8::Local<::v8::Value> completion;
  if (!(*module)->Evaluate(context).ToLocal(&completion)) {
    return ReportUncaught(context, try_catch.Exception());
  }
  // Capability calls settle synchronously, so one checkpoint drains every
  // continuation the script can ever schedule.
  isolate_->PerformMicrotaskCheckpoint();
  out_->flush();
  if (out_of_memory_) {
    return kRunnerOutOfMemory;
  }
  if (!completion->IsPromise()) {
    return kRunnerSuccess;
  }
  ::v8::Local<::v8::Promise> promise = completion.As<::v8::Promise>();
  switch (promise->State()) {
    case ::v8::Promise::kFulfilled:
      return kRunnerSuccess;
    case ::v8::Promise::kRejected:
      return ReportUncaught(context, promise->Result());
    case ::v8::Promise::kPending:
      *err_ << "Uncaught Error: top-level await never settled\n";
      return kRunnerScriptError;
  }
  return kRunnerFault;
}

RunnerExitCode Evaluation::ReportUncaught(::v8::Local<::v8::Context> context,
                                          ::v8::Local<::v8::Value> exception) {
  out_->flush();
  if (out_of_memory_) {
    *err_ << "Uncaught RangeError: JavaScript heap out of memory\n";
    return kRunnerOutOfMemory;
  }
  std::string text;
  if (!exception.IsEmpty() && exception->IsObject()) {
    ::v8::Local<::v8::Value> stack;
    absl::StatusOr<::v8::Local<::v8::String>> key =
        NewString(isolate_, "stack");
    if (key.ok() &&
        exception.As<::v8::Object>()->Get(context, *key).ToLocal(&stack) &&
        stack->IsString()) {
      text = ToStdString(isolate_, stack);
    }
  }
  if (text.empty()) {
    text = exception.IsEmpty() ? "Error: unknown error"
                               : ToStdString(isolate_, exception);
  }
  *err_ << "Uncaught " << text << "\n";
  err_->flush();
  return kRunnerScriptError;
}

absl::Status Evaluation::InstallConsole(::v8::Local<::v8::Context> context) {
  ::v8::Local<::v8::Object> console = ::v8::Object::New(isolate_);
  const std::pair<absl::string_view, ::v8::FunctionCallback> methods[] = {
      {"log", &Evaluation::ConsoleOut},   {"info", &Evaluation::ConsoleOut},
      {"error", &Evaluation::ConsoleErr}, {"warn", &Evaluation::ConsoleErr},
      {"debug", &Evaluation::ConsoleErr},
  };
  for (const auto& [name, callback] : methods) {
    ASSIGN_OR_RETURN(::v8::Local<::v8::String> key, NewString(isolate_, name));
    ASSIGN_OR_RETURN(::v8::Local<::v8::Function> function,
                     ToLocalChecked(::v8::Function::New(context, callback)));
    if (console->Set(context, key, function).IsNothing()) {
      return absl::InternalError("Unable to install console methods.");
    }
  }
  ASSIGN_OR_RETURN(::v8::Local<::v8::String> name,
                   NewString(isolate_, "console"));
  if (context->Global()->Set(context, name, console).IsNothing()) {
    return absl::InternalError("Unable to install console.");
  }
  return absl::OkStatus();
}

absl::StatusOr<::v8::Local<::v8::Module>> Evaluation::CompileModule(
    absl::string_view resource_name, absl::string_view source) {
  ASSIGN_OR_RETURN(::v8::Local<::v8::String> source_string,
                   NewString(isolate_, source));
  ASSIGN_OR_RETURN(::v8::Local<::v8::String> name,
                   NewString(isolate_, resource_name));
  ::v8::ScriptOrigin origin(isolate_, name, 0, 0, false, -1,
                            ::v8::Local<::v8::Value>(), false, false,
                            /*is_module=*/true);
  ::v8::ScriptCompiler::Source compiler_source(source_string, origin);
  return ToLocalChecked(
      absl::StrCat("Unable to compile module ", resource_name),
      ::v8::ScriptCompiler::CompileModule(isolate_, &compiler_source));
}

::v8::MaybeLocal<::v8::Module> Evaluation::ResolveModule(
    ::v8::Local<::v8::Context> context, ::v8::Local<::v8::String> specifier,
    ::v8::Local<::v8::FixedArray> import_assertions,
    ::v8::Local<::v8::Module> referrer) {
  Evaluation* evaluation = From(context);
  return evaluation->Resolve(context,
                             ToStdString(evaluation->isolate_, specifier));
}

::v8::MaybeLocal<::v8::Module> Evaluation::Resolve(
    ::v8::Local<::v8::Context> context, const std::string& specifier) {
  const std::string path = capability::CanonicalImportPath(specifier);
  if (auto it = modules_.find(path); it != modules_.end()) {
    return it->second.Get(isolate_);
  }

  absl::StatusOr<::v8::Local<::v8::Module>> module;
  if (absl::optional<absl::string_view> source = RuntimeModuleSource(path)) {
    module = CompileModule(path, *source);
  } else if (path == kScratchModule) {
    module = NewSyntheticModule(path, {"writeFile", "readFile", "listFiles"});
  } else if (auto binding = export_names_.find(path);
             binding != export_names_.end()) {
    module = NewSyntheticModule(path, {binding->second, "default"});
  } else {
    ThrowError(isolate_, absl::StrCat("Cannot resolve module '", specifier,
                                      "'"));
    return {};
  }
  if (!module.ok()) {
    if (!isolate_->IsExecutionTerminating()) {
      ThrowError(isolate_, module.status().message());
    }
    return {};
  }
  modules_[path].Reset(isolate_, *module);
  return *module;
}

absl::StatusOr<::v8::Local<::v8::Module>> Evaluation::NewSyntheticModule(
    const std::string& path, const std::vector<std::string>& exports) {
  ASSIGN_OR_RETURN(::v8::Local<::v8::String> name, NewString(isolate_, path));
  std::vector<::v8::Local<::v8::String>> export_names;
  for (const std::string& export_name : exports) {
    ASSIGN_OR_RETURN(::v8::Local<::v8::String> export_string,
                     NewString(isolate_, export_name));
    export_names.push_back(export_string);
  }
  ::v8::Local<::v8::Module> module = ::v8::Module::CreateSyntheticModule(
      isolate_, name, export_names, &Evaluation::EvaluateSyntheticModule);
  synthetic_paths_[module->GetIdentityHash()] = path;
  return module;
}

absl::Status Evaluation::SetExport(::v8::Local<::v8::Context> context,
                                   ::v8::Local<::v8::Module> module,
                                   absl::string_view name,
                                   ::v8::FunctionCallback callback,
                                   ::v8::Local<::v8::Value> data) {
  ASSIGN_OR_RETURN(::v8::Local<::v8::String> export_name,
                   NewString(isolate_, name));
  ASSIGN_OR_RETURN(
      ::v8::Local<::v8::Function> function,
      ToLocalChecked(::v8::Function::New(context, callback, data)));
  if (module->SetSyntheticModuleExport(isolate_, export_name, function)
          .IsNothing()) {
    return absl::InternalError(absl::StrCat("Unable to export ", name));
  }
  return absl::OkStatus();
}

::v8::MaybeLocal<::v8::Value> Evaluation::EvaluateSyntheticModule(
    ::v8::Local<::v8::Context> context, ::v8::Local<::v8::Module> module) {
  Evaluation* evaluation = From(context);
  ::v8::Isolate* isolate = evaluation->isolate_;
  auto it = evaluation->synthetic_paths_.find(module->GetIdentityHash());
  if (it == evaluation->synthetic_paths_.end()) {
    ThrowError(isolate, "Unknown synthetic module");
    return {};
  }
  const std::string& path = it->second;

  absl::Status status;
  if (path == kScratchModule) {
    ::v8::Local<::v8::Value> none;
    status = evaluation->SetExport(context, module, "writeFile",
                                   &Evaluation::WriteScratchFile, none);
    if (status.ok()) {
      status = evaluation->SetExport(context, module, "readFile",
                                     &Evaluation::ReadScratchFile, none);
    }
    if (status.ok()) {
      status = evaluation->SetExport(context, module, "listFiles",
                                     &Evaluation::ListScratchFiles, none);
    }
  } else {
    absl::StatusOr<::v8::Local<::v8::String>> data = NewString(isolate, path);
    status = data.status();
    for (absl::string_view name :
         {absl::string_view(evaluation->export_names_[path]),
          absl::string_view("default")}) {
      if (status.ok()) {
        status = evaluation->SetExport(context, module, name,
                                       &Evaluation::CallCapability, *data);
      }
    }
  }
  if (!status.ok()) {
    ThrowError(isolate, status.message());
    return {};
  }

  ::v8::Local<::v8::Promise::Resolver> resolver;
  if (!::v8::Promise::Resolver::New(context).ToLocal(&resolver) ||
      resolver->Resolve(context, ::v8::Undefined(isolate)).IsNothing()) {
    return {};
  }
  return resolver->GetPromise();
}

std::string Evaluation::ValueToText(::v8::Local<::v8::Context> context,
                                    ::v8::Local<::v8::Value> value) {
  if (value->IsString()) {
    return ToStdString(isolate_, value);
  }
  ::v8::TryCatch try_catch(isolate_);
  ::v8::Local<::v8::String> json;
  if (!value->IsUndefined() && !value->IsFunction() &&
      ::v8::JSON::Stringify(context, value).ToLocal(&json)) {
    return ToStdString(isolate_, json);
  }
  // Circular structures, functions and undefined.
  return ToStdString(isolate_, value);
}

std::string Evaluation::FormatArguments(
    const ::v8::FunctionCallbackInfo<::v8::Value>& info) {
  ::v8::Local<::v8::Context> context = isolate_->GetCurrentContext();
  std::vector<std::string> parts;
  parts.reserve(info.Length());
  for (int i = 0; i < info.Length(); ++i) {
    parts.push_back(ValueToText(context, info[i]));
  }
  return absl::StrJoin(parts, " ");
}

void Evaluation::ConsoleOut(
    const ::v8::FunctionCallbackInfo<::v8::Value>& info) {
  Evaluation* evaluation = From(info.GetIsolate()->GetCurrentContext());
  *evaluation->out_ << evaluation->FormatArguments(info) << "\n";
  evaluation->out_->flush();
}

void Evaluation::ConsoleErr(
    const ::v8::FunctionCallbackInfo<::v8::Value>& info) {
  Evaluation* evaluation = From(info.GetIsolate()->GetCurrentContext());
  *evaluation->err_ << evaluation->FormatArguments(info) << "\n";
  evaluation->err_->flush();
}

void Evaluation::CallCapability(
    const ::v8::FunctionCallbackInfo<::v8::Value>& info) {
  ::v8::Isolate* isolate = info.GetIsolate();
  ::v8::Local<::v8::Context> context = isolate->GetCurrentContext();
  Evaluation* evaluation = From(context);
  const std::string path = ToStdString(isolate, info.Data());

  ::v8::Local<::v8::Promise::Resolver> resolver;
  if (!::v8::Promise::Resolver::New(context).ToLocal(&resolver)) {
    return;
  }
  info.GetReturnValue().Set(resolver->GetPromise());

  auto reject = [&](absl::string_view message) {
    absl::StatusOr<::v8::Local<::v8::String>> text =
        NewString(isolate, message);
    if (text.ok() &&
        resolver->Reject(context, ::v8::Exception::Error(*text)).IsNothing()) {
      *evaluation->err_ << "Unable to reject promise for " << path << "\n";
    }
  };

  std::string input_json = "{}";
  if (info.Length() > 0 && !info[0]->IsUndefined()) {
    ::v8::TryCatch try_catch(isolate);
    ::v8::Local<::v8::String> json;
    if (!::v8::JSON::Stringify(context, info[0]).ToLocal(&json)) {
      reject(absl::StrCat(path, ": input is not serializable to JSON"));
      return;
    }
    input_json = ToStdString(isolate, json);
  }

  absl::StatusOr<std::string> output =
      evaluation->channel_->Call(path, input_json);
  if (!output.ok()) {
    reject(absl::StrCat(path, ": ", output.status().message()));
    return;
  }
  absl::StatusOr<::v8::Local<::v8::String>> output_string =
      NewString(isolate, *output);
  ::v8::TryCatch try_catch(isolate);
  ::v8::Local<::v8::Value> value;
  if (!output_string.ok() ||
      !::v8::JSON::Parse(context, *output_string).ToLocal(&value)) {
    reject(absl::StrCat(path, ": capability returned malformed JSON"));
    return;
  }
  if (resolver->Resolve(context, value).IsNothing()) {
    *evaluation->err_ << "Unable to resolve promise for " << path << "\n";
  }
}

void Evaluation::WriteScratchFile(
    const ::v8::FunctionCallbackInfo<::v8::Value>& info) {
  ::v8::Isolate* isolate = info.GetIsolate();
  ::v8::Local<::v8::Context> context = isolate->GetCurrentContext();
  Evaluation* evaluation = From(context);
  if (info.Length() < 2) {
    ThrowError(isolate, "writeFile(name, content) requires two arguments");
    return;
  }
  absl::StatusOr<std::string> path = ScratchPath(
      evaluation->spec_.scratch_dir(), ToStdString(isolate, info[0]));
  absl::Status status = path.status();
  if (status.ok()) {
    status = sapi::file::SetContents(
        *path, evaluation->ValueToText(context, info[1]),
        sapi::file::Defaults());
  }
  if (!status.ok()) {
    ThrowError(isolate, status.message());
  }
}

void Evaluation::ReadScratchFile(
    const ::v8::FunctionCallbackInfo<::v8::Value>& info) {
  ::v8::Isolate* isolate = info.GetIsolate();
  Evaluation* evaluation = From(isolate->GetCurrentContext());
  const std::string name =
      info.Length() > 0 ? ToStdString(isolate, info[0]) : "";
  absl::StatusOr<std::string> path =
      ScratchPath(evaluation->spec_.scratch_dir(), name);
  if (!path.ok()) {
    ThrowError(isolate, path.status().message());
    return;
  }
  std::string contents;
  if (!sapi::file::GetContents(*path, &contents, sapi::file::Defaults())
           .ok()) {
    ThrowError(isolate, absl::StrCat("No such scratch file '", name, "'"));
    return;
  }
  absl::StatusOr<::v8::Local<::v8::String>> result =
      NewString(isolate, contents);
  if (!result.ok()) {
    ThrowError(isolate, result.status().message());
    return;
  }
  info.GetReturnValue().Set(*result);
}

void Evaluation::ListScratchFiles(
    const ::v8::FunctionCallbackInfo<::v8::Value>& info) {
  ::v8::Isolate* isolate = info.GetIsolate();
  ::v8::Local<::v8::Context> context = isolate->GetCurrentContext();
  Evaluation* evaluation = From(context);
  std::vector<std::string> entries;
  std::string error;
  if (!sapi::file_util::fileops::ListDirectoryEntries(
          evaluation->spec_.scratch_dir(), &entries, &error)) {
    ThrowError(isolate, absl::StrCat("Unable to list scratch files: ", error));
    return;
  }
  std::sort(entries.begin(), entries.end());
  ::v8::Local<::v8::Array> names =
      ::v8::Array::New(isolate, static_cast<int>(entries.size()));
  for (size_t i = 0; i < entries.size(); ++i) {
    absl::StatusOr<::v8::Local<::v8::String>> name =
        NewString(isolate, entries[i]);
    if (!name.ok() ||
        names->Set(context, static_cast<uint32_t>(i), *name).IsNothing()) {
      return;
    }
  }
  info.GetReturnValue().Set(names);
}

}  // namespace

ScriptEngine::ScriptEngine(CapabilityChannel* channel, std::ostream* out,
                           std::ostream* err)
    : channel_(channel), out_(out), err_(err) {}

RunnerExitCode ScriptEngine::Run(const ScriptSpec& spec) {
  scriptbox::v8::IsolateHolder isolate(spec.heap_limit_bytes());
  Evaluation evaluation(spec, channel_, out_, err_, isolate.get());
  return evaluation.Run();
}

}  // namespace scriptbox::sandbox
