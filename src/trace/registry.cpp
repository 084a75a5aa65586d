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

#include <errno.h>
#include <signal.h>
#include <string.h>

#include <string>

#include <glog/logging.h>

#include <process/delay.hpp>
#include <process/id.hpp>
#include <process/once.hpp>
#include <process/process.hpp>

#include <stout/abort.hpp>
#include <stout/none.hpp>
#include <stout/stringify.hpp>
#include <stout/synchronized.hpp>

#include "trace/registry.hpp"

using namespace process;

using std::string;

namespace fuseops {
namespace internal {

int probe(pid_t pid)
{
  // With a signal of zero kill(2) sends nothing but still performs
  // error checking, which tells us whether the PID exists.
  if (::kill(pid, 0) == 0) {
    return 0;
  }

  return errno;
}


// Waits for a process to exit, then closes off its trace and removes
// it from the registry.
class LivenessMonitorProcess : public Process<LivenessMonitorProcess>
{
public:
  LivenessMonitorProcess(
      pid_t _pid,
      const trace::ReportFunction& _report,
      const std::shared_ptr<TraceRegistry::Data>& _data,
      const Duration& _interval,
      const LivenessProbe& _probe)
    : ProcessBase(ID::generate("liveness-monitor")),
      pid(_pid),
      report(_report),
      data(_data),
      interval(_interval),
      probe(_probe) {}

  virtual ~LivenessMonitorProcess() {}

protected:
  virtual void initialize()
  {
    poll();
  }

private:
  void poll()
  {
    int error = probe(pid);

    if (error == 0) {
      delay(interval, self(), &Self::poll);
      return;
    }

    // Without permission to probe we can't tell when the process
    // exits, so the trace is never closed.
    if (error == EPERM) {
      LOG(WARNING) << "Failed to kill(2) PID " << pid
                   << "; no permissions. Leaking trace";
      terminate(self());
      return;
    }

    if (error != ESRCH) {
      ABORT("kill(" + stringify(pid) + ", 0): " + string(::strerror(error)));
    }

    report(None());

    synchronized (data->mutex) {
      data->contexts.erase(pid);
    }

    VLOG(1) << "PID " << pid << " exited; closed its trace";

    terminate(self());
  }

  const pid_t pid;
  const trace::ReportFunction report;
  const std::shared_ptr<TraceRegistry::Data> data;
  const Duration interval;
  const LivenessProbe probe;
};


static TraceRegistry* registry = NULL;


TraceRegistry::TraceRegistry(
    trace::Tracer* _tracer,
    bool _grouping,
    const Duration& _interval,
    const LivenessProbe& _probe)
  : tracer(CHECK_NOTNULL(_tracer)),
    grouping(_grouping),
    interval(_interval),
    probe(_probe),
    data(new Data()) {}


TraceRegistry* TraceRegistry::instance()
{
  static Once* initialized = new Once();

  if (!initialized->once()) {
    if (registry == NULL) {
      registry = new TraceRegistry(trace::tracer(), false);
    }
    initialized->done();
  }

  return registry;
}


void TraceRegistry::install(TraceRegistry* _registry)
{
  CHECK_NOTNULL(_registry);

  // Make sure the default has been created so it is not created
  // on top of '_registry' later.
  TraceRegistry* previous = instance();
  registry = _registry;

  delete previous;
}


bool TraceRegistry::enabled() const
{
  return grouping && tracer->enabled();
}


Context TraceRegistry::acquire(pid_t pid, const Context& fallback)
{
  if (!enabled()) {
    return fallback;
  }

  // kill(2) on 0 or a negative PID signals a process group rather
  // than a process, so there is nothing to monitor. The kernel sends
  // some requests (e.g., forgets) with a PID of 0.
  if (pid <= 0) {
    return fallback;
  }

  Option<Context> context;

  synchronized (data->mutex) {
    context = data->contexts.get(pid);

    if (context.isNone()) {
      trace::Trace trace =
        tracer->trace(fallback, "Requests from PID " + stringify(pid));

      data->contexts.put(pid, trace.context);
      context = trace.context;

      // The monitor is garbage collected once it terminates.
      spawn(new LivenessMonitorProcess(
                pid, trace.report, data, interval, probe),
            true);

      VLOG(1) << "Tracing requests from PID " << pid;
    }
  }

  return context.get();
}


Option<Context> TraceRegistry::get(pid_t pid) const
{
  Option<Context> context;

  synchronized (data->mutex) {
    context = data->contexts.get(pid);
  }

  return context;
}


size_t TraceRegistry::size() const
{
  size_t size = 0;

  synchronized (data->mutex) {
    size = data->contexts.size();
  }

  return size;
}

} // namespace internal {
} // namespace fuseops {
