// Copyright 2018 The JqPath Authors.
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

#include "jqpath/cli/command_line.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <memory>
#include <utility>

#include <glog/logging.h>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "jqpath/error.h"
#include "jqpath/logging.h"
#include "jqpath/query.h"
#include "jqpath/result_stream.h"
#include "jqpath/value.h"

DEFINE_bool(raw_output, false,
            "Output top level strings without quotes (-r, --raw-output).");
DEFINE_bool(join_output, false,
            "Like --raw_output but without a newline after each output "
            "(-j, --join-output).");
DEFINE_bool(compact_output, false,
            "Print each output on a single line (-c, --compact-output).");
DEFINE_bool(tab, false, "Indent with one tab per level (--tab).");
DEFINE_int32(indent, 2, "Spaces per indentation level, at most 7 (--indent).");
DEFINE_bool(sort_keys, false,
            "Print object members sorted by key (-S, --sort-keys).");
DEFINE_bool(null_input, false,
            "Run the filter once against null instead of reading input "
            "(-n, --null-input).");
DEFINE_bool(slurp, false,
            "Run the filter once against an array of all input documents "
            "(-s, --slurp).");
DEFINE_bool(exit_status, false,
            "Exit with 1 if the last output is false or null and with 4 if "
            "there is no output (-e, --exit-status).");
DEFINE_bool(halt_on_error, false,
            "Stop at the first input document that fails evaluation.");

namespace jq_path {
namespace cli {

namespace {

constexpr char kProgramName[] = "jqpath";
constexpr int kMaxIndent = 7;

// The single character options and the flags they stand for.
const char* FlagForShortOption(char option) {
  switch (option) {
    case 'r':
      return "--raw_output";
    case 'j':
      return "--join_output";
    case 'c':
      return "--compact_output";
    case 'S':
      return "--sort_keys";
    case 'n':
      return "--null_input";
    case 's':
      return "--slurp";
    case 'e':
      return "--exit_status";
  }
  return nullptr;
}

bool IsShortOptionGroup(const string& arg) {
  if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') return false;
  for (size_t i = 1; i < arg.size(); ++i) {
    if (FlagForShortOption(arg[i]) == nullptr) return false;
  }
  return true;
}

bool ReadFile(const string& file_name, string* contents) {
  std::ifstream file(file_name, std::ios::in | std::ios::binary);
  if (!file) return false;
  contents->assign(std::istreambuf_iterator<char>(file),
                   std::istreambuf_iterator<char>());
  return !file.bad();
}

// Evaluates the query against each input document and renders the outputs.
class QueryRunner {
 public:
  QueryRunner(const CliOptions& options, const Query* query, std::ostream* out,
              std::ostream* err)
      : options_(options),
        write_options_(options.GetWriteOptions()),
        query_(query),
        out_(out),
        err_(err) {}
  QueryRunner(const QueryRunner&) = delete;
  QueryRunner& operator=(const QueryRunner&) = delete;

  // Runs the query against 'input', read from 'source'. Returns false if
  // processing must stop.
  bool Process(const Value& input, const string& source);

  // Reports malformed input or an unreadable file.
  void InputError(const string& message, const string& source) {
    *err_ << kProgramName << ": error (at " << source << "): " << message
          << "\n";
    input_error_ = true;
  }

  bool has_input_error() const { return input_error_; }

  int ExitCode() const;

 private:
  void Emit(const Value& value);

  const CliOptions options_;
  const json_utils::WriteOptions write_options_;
  const Query* const query_;
  std::ostream* const out_;
  std::ostream* const err_;

  bool has_output_ = false;
  Value last_output_;
  bool evaluation_error_ = false;
  bool input_error_ = false;
};

bool QueryRunner::Process(const Value& input, const string& source) {
  const Value* literal = query_->AsLiteral();
  if (literal != nullptr) {
    Emit(*literal);
    return true;
  }

  std::unique_ptr<ResultStream> results = query_->Evaluate(input);
  Value result;
  while (results->Next(&result)) {
    Emit(result);
  }
  if (!results->ok()) {
    *err_ << kProgramName << ": error (at " << source
          << "): " << results->error().message() << "\n";
    evaluation_error_ = true;
    return !options_.halt_on_error;
  }
  return true;
}

void QueryRunner::Emit(const Value& value) {
  if ((options_.raw_output || options_.join_output) && value.IsString()) {
    *out_ << value.AsString();
  } else {
    *out_ << json_utils::WriteJson(value, write_options_);
  }
  if (!options_.join_output) *out_ << "\n";
  has_output_ = true;
  last_output_ = value;
}

int QueryRunner::ExitCode() const {
  if (input_error_) return kExitUsage;
  if (evaluation_error_) return kExitEvaluationError;
  if (options_.exit_status) {
    if (!has_output_) return kExitNoOutput;
    if (!last_output_.Truthy()) return kExitFalsy;
  }
  return kExitOk;
}

}  // namespace

json_utils::WriteOptions CliOptions::GetWriteOptions() const {
  json_utils::WriteOptions write_options;
  write_options.indent = compact_output ? 0 : indent;
  write_options.use_tab = tab && !compact_output;
  write_options.sort_keys = sort_keys;
  return write_options;
}

CliOptions OptionsFromFlags() {
  CliOptions options;
  options.raw_output = FLAGS_raw_output;
  options.join_output = FLAGS_join_output;
  options.compact_output = FLAGS_compact_output;
  options.tab = FLAGS_tab;
  options.indent = FLAGS_indent;
  options.sort_keys = FLAGS_sort_keys;
  options.null_input = FLAGS_null_input;
  options.slurp = FLAGS_slurp;
  options.exit_status = FLAGS_exit_status;
  options.halt_on_error = FLAGS_halt_on_error;
  return options;
}

std::vector<string> ExpandShortFlags(const std::vector<string>& args) {
  std::vector<string> expanded;
  bool options_ended = false;
  for (size_t i = 0; i < args.size(); ++i) {
    const string& arg = args[i];
    if (i == 0 || options_ended) {
      expanded.push_back(arg);
    } else if (arg == "--") {
      options_ended = true;
      expanded.push_back(arg);
    } else if (absl::StartsWith(arg, "--")) {
      // jq spells long options with dashes, gflags with underscores.
      const size_t name_end = std::min(arg.find('='), arg.size());
      expanded.push_back(absl::StrCat(
          "--", absl::StrReplaceAll(arg.substr(2, name_end - 2), {{"-", "_"}}),
          arg.substr(name_end)));
    } else if (IsShortOptionGroup(arg)) {
      for (size_t j = 1; j < arg.size(); ++j) {
        expanded.push_back(FlagForShortOption(arg[j]));
      }
    } else {
      expanded.push_back(arg);
    }
  }
  return expanded;
}

int RunQuery(const CliOptions& options, const string& expression,
             const std::vector<string>& files, std::istream* in,
             std::ostream* out, std::ostream* err) {
  RETURN_VALUE_IF_MSG(in == nullptr || out == nullptr || err == nullptr,
                      kExitUsage, "RunQuery() called without streams");
  if (options.indent < 0 || options.indent > kMaxIndent) {
    *err << kProgramName << ": Cannot indent more than " << kMaxIndent
         << " characters\n";
    return kExitUsage;
  }

  QueryError error;
  std::unique_ptr<Query> query = Query::Create(expression, &error);
  if (query == nullptr) {
    *err << kProgramName << ": error: " << error.message();
    if (error.position() >= 0) *err << " at position " << error.position();
    *err << "\n" << kProgramName << ": 1 compile error\n";
    return kExitUsage;
  }
  VLOG(1) << "Running " << query->DebugString();

  QueryRunner runner(options, query.get(), out, err);
  if (options.null_input) {
    runner.Process(Value(), "<unknown>");
    return runner.ExitCode();
  }

  // Every source is read completely before its documents are evaluated.
  std::vector<std::pair<string, string>> sources;
  if (files.empty()) {
    sources.emplace_back("<stdin>",
                         string(std::istreambuf_iterator<char>(*in),
                                std::istreambuf_iterator<char>()));
  }
  for (const string& file_name : files) {
    string contents;
    if (!ReadFile(file_name, &contents)) {
      LOG(WARNING) << "Cannot read " << file_name;
      runner.InputError("Could not open file", file_name);
      continue;
    }
    sources.emplace_back(file_name, std::move(contents));
  }

  Array slurped;
  for (const auto& source : sources) {
    json_utils::JsonDocumentReader reader(source.second);
    Value document;
    bool keep_going = true;
    while (keep_going && reader.Next(&document)) {
      if (options.slurp) {
        slurped.push_back(std::move(document));
      } else {
        keep_going = runner.Process(document, source.first);
      }
    }
    VLOG(1) << "Read " << reader.documents_read() << " document(s) from "
            << source.first;
    if (!reader.ok()) {
      runner.InputError(reader.error(), source.first);
      break;
    }
    if (!keep_going) break;
  }

  if (options.slurp && !runner.has_input_error()) {
    runner.Process(Value(std::move(slurped)),
                   files.empty() ? "<stdin>" : files.back());
  }
  return runner.ExitCode();
}

}  // namespace cli
}  // namespace jq_path
