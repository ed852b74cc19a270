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

// Guards for arguments that only a caller bug can produce, such as a null
// out-parameter. A failing check logs at DFATAL, which aborts debug builds,
// and returns the given value from the enclosing function otherwise. Errors
// caused by user input are reported through QueryError instead.

#ifndef JQ_PATH_LOGGING_H_
#define JQ_PATH_LOGGING_H_

#include <glog/logging.h>

#include "absl/base/optimization.h"

#define RETURN_VALUE_IF_MSG(condition, value, msg) \
  do {                                             \
    if (ABSL_PREDICT_FALSE((condition))) {         \
      LOG(DFATAL) << msg;                          \
      return (value);                              \
    }                                              \
  } while (false)

#define RETURN_FALSE_IF_MSG(condition, msg) \
  RETURN_VALUE_IF_MSG(condition, false, msg)

#define RETURN_FALSE_IF(condition)                              \
  RETURN_FALSE_IF_MSG(condition, "Returning false; condition (" \
                                     << #condition << ") is true.")

#define RETURN_NULL_IF_MSG(condition, msg) \
  RETURN_VALUE_IF_MSG(condition, nullptr, msg)

#define RETURN_NULL_IF(condition)                                \
  RETURN_NULL_IF_MSG(condition, "Returning nullptr; condition (" \
                                    << #condition << ") is true.")

#endif  // JQ_PATH_LOGGING_H_
