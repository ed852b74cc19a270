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

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "absl/strings/str_cat.h"

namespace jq_path {
namespace cli {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

class CommandLineTest : public ::testing::Test {
 protected:
  // Runs 'expression' over 'input' and captures both output streams.
  int Run(const string& expression, const string& input,
          const std::vector<string>& files = {}) {
    std::istringstream in(input);
    std::ostringstream out;
    std::ostringstream err;
    const int exit_code = RunQuery(options_, expression, files, &in, &out,
                                   &err);
    out_ = out.str();
    err_ = err.str();
    return exit_code;
  }

  string WriteTempFile(const string& name, const string& contents) {
    const string path = ::testing::TempDir() + name;
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    file << contents;
    return path;
  }

  CliOptions options_;
  string out_;
  string err_;
};

TEST_F(CommandLineTest, NullInput) {
  options_.null_input = true;
  EXPECT_EQ(kExitOk, Run("true", "ignored"));
  EXPECT_EQ("true\n", out_);
  EXPECT_EQ("", err_);
}

TEST_F(CommandLineTest, PrettyPrintsByDefault) {
  EXPECT_EQ(kExitOk, Run(".", "{\"a\":[1,2]}"));
  EXPECT_EQ("{\n  \"a\": [\n    1,\n    2\n  ]\n}\n", out_);
}

TEST_F(CommandLineTest, EveryDocumentIsProcessed) {
  options_.compact_output = true;
  EXPECT_EQ(kExitOk, Run(".a", "{\"a\":1} {\"a\":[2]}\n{\"a\":\"x\"}"));
  EXPECT_EQ("1\n[2]\n\"x\"\n", out_);
}

TEST_F(CommandLineTest, EmptyInputProducesNothing) {
  EXPECT_EQ(kExitOk, Run(".", "  \n"));
  EXPECT_EQ("", out_);
}

TEST_F(CommandLineTest, RawOutput) {
  options_.raw_output = true;
  EXPECT_EQ(kExitOk, Run(".[]", "[\"a b\", 1, {\"c\":\"d\"}]"));
  EXPECT_EQ("a b\n1\n{\n  \"c\": \"d\"\n}\n", out_);
}

TEST_F(CommandLineTest, JoinOutput) {
  options_.join_output = true;
  EXPECT_EQ(kExitOk, Run(".[]", "[\"a\", 1, \"b\"]"));
  EXPECT_EQ("a1b", out_);
}

TEST_F(CommandLineTest, SortKeysAndTabs) {
  options_.sort_keys = true;
  options_.tab = true;
  EXPECT_EQ(kExitOk, Run(".", "{\"b\":1,\"a\":2}"));
  EXPECT_EQ("{\n\t\"a\": 2,\n\t\"b\": 1\n}\n", out_);
}

TEST_F(CommandLineTest, Indent) {
  options_.indent = 4;
  EXPECT_EQ(kExitOk, Run(".", "[1]"));
  EXPECT_EQ("[\n    1\n]\n", out_);

  options_.indent = 8;
  EXPECT_EQ(kExitUsage, Run(".", "[1]"));
  EXPECT_EQ("", out_);
  EXPECT_EQ("jqpath: Cannot indent more than 7 characters\n", err_);
}

TEST_F(CommandLineTest, Slurp) {
  options_.slurp = true;
  options_.compact_output = true;
  EXPECT_EQ(kExitOk, Run(".", "1 \"two\" [3]"));
  EXPECT_EQ("[1,\"two\",[3]]\n", out_);
}

TEST_F(CommandLineTest, SlurpEmptyInput) {
  options_.slurp = true;
  options_.compact_output = true;
  EXPECT_EQ(kExitOk, Run(".", ""));
  EXPECT_EQ("[]\n", out_);
}

TEST_F(CommandLineTest, SyntaxError) {
  EXPECT_EQ(kExitUsage, Run(".a |", "{}"));
  EXPECT_EQ("", out_);
  EXPECT_EQ(
      "jqpath: error: Unexpected end of input at position 4\n"
      "jqpath: 1 compile error\n",
      err_);
}

TEST_F(CommandLineTest, EvaluationErrorContinuesWithNextDocument) {
  EXPECT_EQ(kExitEvaluationError, Run(".missing", "{} {\"missing\":1}"));
  EXPECT_EQ("1\n", out_);
  EXPECT_EQ("jqpath: error (at <stdin>): Key \"missing\" not found\n", err_);
}

TEST_F(CommandLineTest, HaltOnError) {
  options_.halt_on_error = true;
  EXPECT_EQ(kExitEvaluationError, Run(".missing", "{} {\"missing\":1}"));
  EXPECT_EQ("", out_);
}

TEST_F(CommandLineTest, OutputsBeforeErrorArePrinted) {
  options_.compact_output = true;
  EXPECT_EQ(kExitEvaluationError, Run(".[] | .a", "[{\"a\":1}, 2]"));
  EXPECT_EQ("1\n", out_);
  EXPECT_EQ("jqpath: error (at <stdin>): Cannot index number with \"a\"\n",
            err_);
}

TEST_F(CommandLineTest, MalformedInput) {
  options_.compact_output = true;
  EXPECT_EQ(kExitUsage, Run(".", "{\"a\":1} {\"a\":"));
  EXPECT_EQ("{\"a\":1}\n", out_);
  EXPECT_THAT(err_, HasSubstr("jqpath: error (at <stdin>): "));
  EXPECT_THAT(err_, HasSubstr("Unfinished JSON term"));
}

TEST_F(CommandLineTest, InputErrorOutranksEvaluationError) {
  EXPECT_EQ(kExitUsage, Run(".missing", "{} [1"));
}

TEST_F(CommandLineTest, SlurpSkippedAfterInputError) {
  options_.slurp = true;
  EXPECT_EQ(kExitUsage, Run(".", "1 2 ]"));
  EXPECT_EQ("", out_);
}

TEST_F(CommandLineTest, ExitStatus) {
  options_.exit_status = true;
  EXPECT_EQ(kExitOk, Run(".a", "{\"a\":0}"));
  EXPECT_EQ(kExitFalsy, Run(".a", "{\"a\":null}"));
  EXPECT_EQ(kExitFalsy, Run(".[]", "[true, false]"));
  EXPECT_EQ(kExitOk, Run(".[]", "[false, true]"));
  EXPECT_EQ(kExitNoOutput, Run(".[]", "[]"));
  EXPECT_EQ(kExitEvaluationError, Run(".a", "5"));
}

TEST_F(CommandLineTest, LiteralIsEmittedOncePerInput) {
  options_.compact_output = true;
  EXPECT_EQ(kExitOk, Run("\"x\"", "1 2 3"));
  EXPECT_EQ("\"x\"\n\"x\"\n\"x\"\n", out_);
}

TEST_F(CommandLineTest, ReadsFiles) {
  options_.compact_output = true;
  const string first = WriteTempFile("command_line_test_1.json", "{\"a\":1}");
  const string second =
      WriteTempFile("command_line_test_2.json", "{\"a\":2} {}");
  EXPECT_EQ(kExitEvaluationError, Run(".a", "{\"a\":0}", {first, second}));
  EXPECT_EQ("1\n2\n", out_);
  EXPECT_EQ(absl::StrCat("jqpath: error (at ", second,
                         "): Key \"a\" not found\n"),
            err_);
}

TEST_F(CommandLineTest, MissingFile) {
  const string missing = ::testing::TempDir() + "no_such_dir/input.json";
  EXPECT_EQ(kExitUsage, Run(".", "", {missing}));
  EXPECT_EQ(absl::StrCat("jqpath: error (at ", missing,
                         "): Could not open file\n"),
            err_);
}

TEST_F(CommandLineTest, GetWriteOptions) {
  options_.indent = 5;
  options_.tab = true;
  EXPECT_EQ(5, options_.GetWriteOptions().indent);
  EXPECT_TRUE(options_.GetWriteOptions().use_tab);
  options_.compact_output = true;
  EXPECT_EQ(0, options_.GetWriteOptions().indent);
  EXPECT_FALSE(options_.GetWriteOptions().use_tab);
}

TEST(ExpandShortFlagsTest, ShortOptionGroups) {
  EXPECT_THAT(ExpandShortFlags({"jqpath", "-rc", ".a", "file.json"}),
              ElementsAre("jqpath", "--raw_output", "--compact_output", ".a",
                          "file.json"));
  EXPECT_THAT(ExpandShortFlags({"jqpath", "-n", "-e", "-S", "-s", "-j", "."}),
              ElementsAre("jqpath", "--null_input", "--exit_status",
                          "--sort_keys", "--slurp", "--join_output", "."));
}

TEST(ExpandShortFlagsTest, LongOptions) {
  EXPECT_THAT(
      ExpandShortFlags({"jqpath", "--raw-output", "--indent=3", "--tab", "."}),
      ElementsAre("jqpath", "--raw_output", "--indent=3", "--tab", "."));
  EXPECT_THAT(ExpandShortFlags({"jqpath", "--sort-keys=a-b", "."}),
              ElementsAre("jqpath", "--sort_keys=a-b", "."));
}

TEST(ExpandShortFlagsTest, KeepsOtherArguments) {
  // '-x' is not a known option and '.[-1]' is an expression.
  EXPECT_THAT(ExpandShortFlags({"jqpath", "-x", ".[-1]", "-"}),
              ElementsAre("jqpath", "-x", ".[-1]", "-"));
  EXPECT_THAT(ExpandShortFlags({"jqpath", "-c", "--", "-rc", "--tab"}),
              ElementsAre("jqpath", "--compact_output", "--", "-rc", "--tab"));
}

}  // namespace
}  // namespace cli
}  // namespace jq_path
