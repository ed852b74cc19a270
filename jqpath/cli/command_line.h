/*
 * Copyright 2018 The JqPath Authors.
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

// The jq compatible command line front end: option handling, input
// acquisition and output rendering.

#ifndef JQ_PATH_CLI_COMMAND_LINE_H_
#define JQ_PATH_CLI_COMMAND_LINE_H_

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include <gflags/gflags.h>

#include "jqpath/json_utils.h"
#include "jqpath/platform/types.h"

DECLARE_bool(raw_output);
DECLARE_bool(join_output);
DECLARE_bool(compact_output);
DECLARE_bool(tab);
DECLARE_int32(indent);
DECLARE_bool(sort_keys);
DECLARE_bool(null_input);
DECLARE_bool(slurp);
DECLARE_bool(exit_status);
DECLARE_bool(halt_on_error);

namespace jq_path {
namespace cli {

// Process exit codes, as jq uses them.
enum ExitCode {
  kExitOk = 0,
  // With --exit_status: the last output was false or null.
  kExitFalsy = 1,
  // Usage errors, syntax errors, unreadable files and malformed input.
  kExitUsage = 2,
  // With --exit_status: there was no output at all.
  kExitNoOutput = 4,
  // At least one input document failed evaluation.
  kExitEvaluationError = 5,
};

// The command line options. Read once from the flags at startup and never
// modified afterwards.
struct CliOptions {
  // Print top level string outputs without quotes.
  bool raw_output = false;
  // Like raw_output, and no newline after each output.
  bool join_output = false;
  // Print each output on a single line.
  bool compact_output = false;
  // Indent with tabs instead of spaces.
  bool tab = false;
  // Spaces per indentation level.
  int indent = 2;
  // Print object members sorted by key.
  bool sort_keys = false;
  // Evaluate once against null instead of reading input.
  bool null_input = false;
  // Evaluate once against an array of all input documents.
  bool slurp = false;
  // Derive the exit code from the last output.
  bool exit_status = false;
  // Stop at the first evaluation error.
  bool halt_on_error = false;

  // The JSON layout selected by these options.
  json_utils::WriteOptions GetWriteOptions() const;
};

// Captures the current flag values.
CliOptions OptionsFromFlags();

// Rewrites jq style options into the names of the flags above so that the
// result can be handed to gflags: '-rc' becomes '--raw_output
// --compact_output' and '--raw-output' becomes '--raw_output'. Arguments after
// '--' and arguments that are not options are kept as they are.
std::vector<string> ExpandShortFlags(const std::vector<string>& args);

// Runs 'expression' over the JSON documents read from 'files', or from 'in'
// if 'files' is empty, writing outputs to 'out' and diagnostics to 'err'.
// Returns the process exit code.
int RunQuery(const CliOptions& options, const string& expression,
             const std::vector<string>& files, std::istream* in,
             std::ostream* out, std::ostream* err);

}  // namespace cli
}  // namespace jq_path

#endif  // JQ_PATH_CLI_COMMAND_LINE_H_
