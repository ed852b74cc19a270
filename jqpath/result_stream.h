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

#ifndef JQ_PATH_RESULT_STREAM_H_
#define JQ_PATH_RESULT_STREAM_H_

#include <vector>

#include "jqpath/error.h"
#include "jqpath/value.h"

namespace jq_path {

// A lazy, pull based sequence of query results. Every call to Next() runs just
// enough of the evaluation to produce one more value. A stream is used by a
// single consumer and is abandoned simply by destroying it.
//
// Sample use:
//   std::unique_ptr<ResultStream> results = query->Evaluate(input);
//   Value result;
//   while (results->Next(&result)) { ... }
//   if (!results->ok()) LOG(INFO) << results->error();
class ResultStream {
 public:
  ResultStream(const ResultStream&) = delete;
  ResultStream& operator=(const ResultStream&) = delete;
  virtual ~ResultStream() = default;

  // Stores the next result in 'result' and returns true. Returns false when
  // the sequence is exhausted or evaluation failed; ok() tells the two apart.
  // Once Next() returned false it keeps returning false.
  virtual bool Next(Value* result) = 0;

  bool ok() const { return error_.ok(); }
  const QueryError& error() const { return error_; }

 protected:
  ResultStream() = default;

  // Records 'error' and returns false, for use as 'return Fail(...)'.
  bool Fail(const QueryError& error);

 private:
  QueryError error_;
};

// Pulls every remaining value out of 'stream' into 'results'. Returns false if
// the stream ended with an error, which is then copied to 'error'. Values
// produced before the error are still appended.
bool DrainStream(ResultStream* stream, std::vector<Value>* results,
                 QueryError* error);

}  // namespace jq_path

#endif  // JQ_PATH_RESULT_STREAM_H_
