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

#ifndef __FUSEOPS_TRACE_REGISTRY_HPP__
#define __FUSEOPS_TRACE_REGISTRY_HPP__

#include <sys/types.h>

#include <memory>
#include <mutex>

#include <stout/duration.hpp>
#include <stout/hashmap.hpp>
#include <stout/lambda.hpp>
#include <stout/option.hpp>

#include <fuseops/context.hpp>
#include <fuseops/trace.hpp>

namespace fuseops {
namespace internal {

// Checks whether a process exists without affecting it. Returns 0 if
// it does, otherwise the errno kill(2) failed with (ESRCH if it does
// not exist, EPERM if we may not signal it).
typedef lambda::function<int(pid_t)> LivenessProbe;

// The default probe: kill(pid, 0).
int probe(pid_t pid);


/**
 * Groups every op issued by the same process under one trace.
 *
 * The first op seen from a PID starts a trace labelled "Requests from
 * PID <pid>"; later ops from that PID get the same context back. Each
 * such trace is watched by a liveness monitor that polls the PID and,
 * once the process is gone, closes the trace and forgets the PID.
 *
 * NOTE: this spawns one monitor per distinct PID and never reclaims
 * traces for PIDs it is not allowed to probe. It is a debugging aid
 * and is off by default.
 */
class TraceRegistry
{
public:
  TraceRegistry(
      trace::Tracer* tracer,
      bool enabled,
      const Duration& interval = Milliseconds(50),
      const LivenessProbe& probe = &internal::probe);

  // Returns the process-wide registry. Until one is installed this
  // is a disabled registry.
  static TraceRegistry* instance();

  // Replaces the process-wide registry, taking ownership. Monitors
  // spawned by the previous registry keep running. Only call this
  // while no ops are being initialized.
  static void install(TraceRegistry* registry);

  // Whether ops are grouped at all: requires both the registry to be
  // enabled and the tracer to be recording.
  bool enabled() const;

  // Returns the context ops from 'pid' should run under: 'fallback'
  // if grouping is disabled or 'pid' does not name a single process,
  // otherwise the PID's trace context.
  Context acquire(pid_t pid, const Context& fallback);

  // Returns the PID's trace context, if one is active.
  Option<Context> get(pid_t pid) const;

  size_t size() const;

private:
  friend class LivenessMonitorProcess;

  // Shared with the monitors, which may outlive the registry.
  struct Data
  {
    std::mutex mutex;
    hashmap<pid_t, Context> contexts;
  };

  TraceRegistry(const TraceRegistry&); // Not copyable.
  TraceRegistry& operator=(const TraceRegistry&); // Not assignable.

  trace::Tracer* tracer;
  const bool grouping;
  const Duration interval;
  const LivenessProbe probe;

  std::shared_ptr<Data> data;
};

} // namespace internal {
} // namespace fuseops {

#endif // __FUSEOPS_TRACE_REGISTRY_HPP__
