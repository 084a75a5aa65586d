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

#include <glog/logging.h>

#include <fuseops/trace.hpp>

#include "common/initialize.hpp"

#include "trace/local.hpp"
#include "trace/registry.hpp"

namespace fuseops {
namespace internal {

Try<Nothing> initialize(const Flags& flags)
{
  if (flags.trace_file.isSome()) {
    Try<LocalTracer*> tracer = LocalTracer::create(flags.trace_file.get());
    if (tracer.isError()) {
      return Error("Failed to create tracer: " + tracer.error());
    }

    // Lives for the rest of the process.
    trace::install(tracer.get());
  }

  if (flags.trace_by_pid) {
    if (!trace::tracer()->enabled()) {
      LOG(WARNING) << "Ignoring --trace_by_pid as tracing is disabled";
    } else {
      LOG(WARNING) << "Grouping traces by PID; this leaks resources and "
                   << "should not be used in production";
    }
  }

  TraceRegistry::install(new TraceRegistry(
      trace::tracer(),
      flags.trace_by_pid,
      flags.liveness_poll_interval));

  return Nothing();
}

} // namespace internal {
} // namespace fuseops {
