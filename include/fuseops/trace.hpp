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

#ifndef __FUSEOPS_TRACE_HPP__
#define __FUSEOPS_TRACE_HPP__

#include <string>

#include <stout/error.hpp>
#include <stout/lambda.hpp>
#include <stout/option.hpp>

#include <fuseops/context.hpp>

namespace fuseops {
namespace trace {

// Closes off a span, recording the error (if any) the work ended with.
typedef lambda::function<void(const Option<Error>&)> ReportFunction;


// A context scoped to a newly started span, together with the
// function that closes the span.
struct Trace
{
  Trace(const Context& _context, const ReportFunction& _report)
    : context(_context), report(_report) {}

  Context context;
  ReportFunction report;
};


class Tracer
{
public:
  virtual ~Tracer() {}

  // Whether spans are being recorded at all.
  virtual bool enabled() const = 0;

  // Starts a span under 'parent' even when 'parent' carries no
  // trace, in which case the span is the root of a new trace.
  virtual Trace trace(const Context& parent, const std::string& label) = 0;

  // Starts a child span of the trace 'parent' belongs to. When
  // 'parent' carries no trace this returns 'parent' itself and a
  // report function that does nothing.
  virtual Trace startSpan(
      const Context& parent,
      const std::string& label) = 0;
};


// A tracer that never records anything. This is what operations
// report to until another tracer is installed.
class NoopTracer : public Tracer
{
public:
  virtual ~NoopTracer() {}

  virtual bool enabled() const;

  virtual Trace trace(const Context& parent, const std::string& label);

  virtual Trace startSpan(const Context& parent, const std::string& label);
};


// Returns the process-wide tracer.
Tracer* tracer();


// Installs 'tracer' as the process-wide tracer. The caller keeps
// ownership and must keep it alive while installed. Passing NULL
// restores the NoopTracer.
void install(Tracer* tracer);

} // namespace trace {
} // namespace fuseops {

#endif // __FUSEOPS_TRACE_HPP__
