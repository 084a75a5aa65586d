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

#ifndef __FUSEOPS_TRACE_LOCAL_HPP__
#define __FUSEOPS_TRACE_LOCAL_HPP__

#include <string>

#include <process/future.hpp>
#include <process/owned.hpp>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include <fuseops/context.hpp>
#include <fuseops/span.hpp>
#include <fuseops/trace.hpp>

namespace fuseops {
namespace internal {

// Forward declaration.
class TraceRecorderProcess;


// A tracer that appends every finished span to a local file, one
// JSON object per line:
//
//   {"trace_id": ..., "span_id": ..., "span_parent": ..., "label": ...,
//    "start": <ns>, "end": <ns>, "error": ...}
//
// 'span_parent' is 0 for the root span of a trace and 'error' is only
// present when the span ended with one.
class LocalTracer : public trace::Tracer
{
public:
  static Try<LocalTracer*> create(const std::string& path);

  virtual ~LocalTracer();

  virtual bool enabled() const;

  virtual trace::Trace trace(const Context& parent, const std::string& label);

  virtual trace::Trace startSpan(
      const Context& parent,
      const std::string& label);

  // Completes once every span reported before the call is written.
  process::Future<Nothing> flush();

private:
  explicit LocalTracer(process::Owned<TraceRecorderProcess> process);

  LocalTracer(const LocalTracer&); // Not copyable.
  LocalTracer& operator=(const LocalTracer&); // Not assignable.

  trace::Trace start(const Context& parent, const trace::Span& span);

  process::Owned<TraceRecorderProcess> process;
};

} // namespace internal {
} // namespace fuseops {

#endif // __FUSEOPS_TRACE_LOCAL_HPP__
