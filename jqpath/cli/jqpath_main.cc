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

#include <iostream>
#include <string>
#include <vector>

#include <glog/logging.h>
#include <gflags/gflags.h>

#include "jqpath/cli/command_line.h"

namespace {

using ::jq_path::cli::ExpandShortFlags;
using ::jq_path::cli::OptionsFromFlags;
using ::jq_path::cli::RunQuery;

constexpr const char kUsage[] =
    "jqpath [OPTIONS] <expression> [FILE...]\n"
    "\n"
    "Runs a jq filter over the JSON documents read from the FILEs, or from\n"
    "standard input if there are none.\n"
    "\n"
    "  -r, --raw-output      print top level strings without quotes\n"
    "  -j, --join-output     like -r, without newlines between outputs\n"
    "  -c, --compact-output  print each output on a single line\n"
    "  -n, --null-input      use null as the only input\n"
    "  -s, --slurp           read all inputs into one array\n"
    "  -e, --exit-status     derive the exit code from the last output\n"
    "  -S, --sort-keys       print object members sorted by key\n"
    "      --tab             indent with tabs\n"
    "      --indent N        indent with N spaces\n"
    "      --halt_on_error   stop at the first evaluation error";

}  // namespace

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  gflags::SetUsageMessage(kUsage);

  std::vector<std::string> args =
      ExpandShortFlags(std::vector<std::string>(argv, argv + argc));
  std::vector<char*> expanded_argv;
  for (std::string& arg : args) {
    expanded_argv.push_back(&arg[0]);
  }
  int expanded_argc = static_cast<int>(expanded_argv.size());
  char** parsed_argv = expanded_argv.data();
  gflags::ParseCommandLineFlags(&expanded_argc, &parsed_argv, true);

  if (expanded_argc < 2) {
    std::cerr << "Usage: " << kUsage << std::endl;
    return ::jq_path::cli::kExitUsage;
  }
  const std::string expression = parsed_argv[1];
  const std::vector<std::string> files(parsed_argv + 2,
                                       parsed_argv + expanded_argc);
  return RunQuery(OptionsFromFlags(), expression, files, &std::cin,
                  &std::cout, &std::cerr);
}
