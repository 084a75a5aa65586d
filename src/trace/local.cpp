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

#include <fcntl.h>

#include <sys/stat.h>

#include <sstream>

#include <glog/logging.h>

#include <process/clock.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/pid.hpp>
#include <process/process.hpp>
#include <process/time.hpp>

#include <stout/json.hpp>
#include <stout/os.hpp>
#include <stout/stringify.hpp>

#include "trace/local.hpp"

using namespace process;

using std::string;

namespace fuseops {
namespace internal {

using trace::Span;
using trace::Trace;

class TraceRecorderProcess : public Process<TraceRecorderProcess>
{
public:
  explicit TraceRecorderProcess(int _fd)
    : ProcessBase(ID::generate("trace-recorder")),
      fd(_fd) {}

  virtual ~TraceRecorderProcess()
  {
    os::close(fd);
  }

  void record(
      const Span& span,
      const Time& end,
      const Option<Error>& error)
  {
    JSON::Object object;

    object.values["trace_id"] = stringify(span.traceId);
    object.values["span_id"] = stringify(span.id);

    if (span.parent.isSome()) {
      object.values["span_parent"] = stringify(span.parent.get());
    } else {
      object.values["span_parent"] = 0;
    }

    object.values["label"] = span.label;
    object.values["start"] = span.start.duration().ns();
    object.values["end"] = end.duration().ns();

    if (error.isSome()) {
      object.values["error"] = error.get().message;
    }

    std::ostringstream out;
    out << object << "\n";

    Try<Nothing> write = os::write(fd, out.str());
    if (write.isError()) {
      LOG(WARNING) << "Failed to record span '" << span.label << "': "
                   << write.error();
    }
  }

  Nothing flush()
  {
    return Nothing();
  }

private:
  const int fd;
};


Try<LocalTracer*> LocalTracer::create(const string& path)
{
  Try<int> fd = os::open(
      path,
      O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC,
      S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);

  if (fd.isError()) {
    return Error("Failed to open '" + path + "': " + fd.error());
  }

  VLOG(1) << "Recording traces to '" << path << "'";

  return new LocalTracer(
      Owned<TraceRecorderProcess>(new TraceRecorderProcess(fd.get())));
}


LocalTracer::LocalTracer(Owned<TraceRecorderProcess> _process)
  : process(_process)
{
  spawn(CHECK_NOTNULL(process.get()));
}


LocalTracer::~LocalTracer()
{
  // Let the recorder write out spans reported before now.
  terminate(process.get(), false);
  wait(process.get());
}


bool LocalTracer::enabled() const
{
  return true;
}


Trace LocalTracer::trace(const Context& parent, const string& label)
{
  if (parent.span().isSome()) {
    return start(parent, Span(parent.span().get(), label));
  }

  return start(parent, Span(label));
}


Trace LocalTracer::startSpan(const Context& parent, const string& label)
{
  if (parent.span().isNone()) {
    return Trace(parent, [](const Option<Error>&) {});
  }

  return start(parent, Span(parent.span().get(), label));
}


Future<Nothing> LocalTracer::flush()
{
  return dispatch(process.get(), &TraceRecorderProcess::flush);
}


Trace LocalTracer::start(const Context& parent, const Span& span)
{
  // Reports for a span that outlives this tracer are dropped along
  // with the recorder.
  PID<TraceRecorderProcess> recorder = process->self();

  return Trace(
      parent.withSpan(span),
      [=](const Option<Error>& error) {
        dispatch(
            recorder,
            &TraceRecorderProcess::record,
            span,
            Clock::now(),
            error);
      });
}

} // namespace internal {
} // namespace fuseops {
