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

#ifndef JQ_PATH_INTERNAL_MODEL_MODEL_H_
#define JQ_PATH_INTERNAL_MODEL_MODEL_H_

#include "jqpath/internal/model/access.h"  // IWYU pragma: export
#include "jqpath/internal/model/builtins.h"  // IWYU pragma: export
#include "jqpath/internal/model/comparison.h"  // IWYU pragma: export
#include "jqpath/internal/model/composition.h"  // IWYU pragma: export
#include "jqpath/internal/model/construct.h"  // IWYU pragma: export
#include "jqpath/internal/model/node.h"  // IWYU pragma: export
#include "jqpath/internal/model/select.h"  // IWYU pragma: export
#include "jqpath/internal/model/wildcard.h"  // IWYU pragma: export

#endif  // JQ_PATH_INTERNAL_MODEL_MODEL_H_
