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

#ifndef __FUSEOPS_SPAN_HPP__
#define __FUSEOPS_SPAN_HPP__

#include <string>

#include <process/clock.hpp>
#include <process/time.hpp>

#include <stout/option.hpp>
#include <stout/uuid.hpp>

namespace fuseops {
namespace trace {

/**
 * A Span is one timed unit of work that belongs to a trace.
 * A trace consists of multiple spans:
 *
 *   Requests from PID 42 -> LookUpInode(inode=1)
 *                        \ GetInodeAttributes(inode=7)
 *
 * A span without a parent is the root of its trace.
 */
struct Span
{
  explicit Span(const std::string& _label)
    : id(UUID::random()),
      traceId(UUID::random()),
      label(_label),
      start(process::Clock::now()) {}

  Span(const Span& _parent, const std::string& _label)
    : id(UUID::random()),
      parent(_parent.id),
      traceId(_parent.traceId),
      label(_label),
      start(process::Clock::now()) {}

  UUID id;
  Option<UUID> parent;

  UUID traceId;

  std::string label;
  process::Time start;
};

} // namespace trace {
} // namespace fuseops {

#endif // __FUSEOPS_SPAN_HPP__
