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

#ifndef JQ_PATH_PLATFORM_MAP_UTIL_H_
#define JQ_PATH_PLATFORM_MAP_UTIL_H_

#include <utility>

namespace gtl {

template <typename Map>
bool InsertIfNotPresent(Map* m, const typename Map::key_type& key,
                        const typename Map::mapped_type& value) {
  return m->insert({key, value}).second;
}

template <typename Map, typename Key>
bool ContainsKey(const Map& map, const Key& key) {
  return map.find(key) != map.end();
}

template <typename Map, typename Key>
const typename Map::mapped_type* FindOrNull(const Map& m, const Key& key) {
  auto it = m.find(key);
  if (it == m.end()) return nullptr;
  return &it->second;
}

}  // namespace gtl

#endif  // JQ_PATH_PLATFORM_MAP_UTIL_H_
