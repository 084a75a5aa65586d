/**
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef __FUSEOPS_INITIALIZE_HPP__
#define __FUSEOPS_INITIALIZE_HPP__

#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "common/flags.hpp"

namespace fuseops {
namespace internal {

// Installs the process-wide tracer and trace registry described by
// 'flags'. Call once at startup, before any op is created.
Try<Nothing> initialize(const Flags& flags);

} // namespace internal {
} // namespace fuseops {

#endif // __FUSEOPS_INITIALIZE_HPP__
