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

#include <cxxabi.h>
#include <stdlib.h>

#include <string>
#include <typeinfo>

#include <glog/logging.h>

#include <stout/strings.hpp>

#include <fuseops/ops.hpp>

#include "trace/registry.hpp"

using std::string;

namespace fuseops {

using internal::TraceRegistry;

// Returns the readable form of a type name from std::type_info.
static string demangle(const char* name)
{
  int status = 0;
  char* demangled = abi::__cxa_demangle(name, NULL, NULL, &status);
  if (demangled == NULL || status != 0) {
    return name;
  }

  string result(demangled);
  ::free(demangled);
  return result;
}


CommonOp::CommonOp()
  : initialized(false),
    responded(false),
    ctx(Context::background()),
    op(NULL),
    kernelRequest(NULL) {}


void CommonOp::init(
    const Context& context,
    const Op* _op,
    Request* request,
    const LogFunction& _log,
    const FinishFunction& _finished)
{
  CHECK(!initialized) << "Op initialized twice";

  op = CHECK_NOTNULL(_op);
  kernelRequest = CHECK_NOTNULL(request);
  hdr = request->header();
  log = _log;
  finished = _finished;

  initialized = true;

  // Run under the trace for the calling PID, if we group by PID.
  ctx = TraceRegistry::instance()->acquire(hdr.pid, context);

  // Set up a span for this op.
  trace::Trace trace = trace::tracer()->startSpan(ctx, shortDesc());
  ctx = trace.context;

  // When the op is finished, close the span before telling the
  // caller.
  const trace::ReportFunction report = trace.report;
  const FinishFunction previous = finished;
  finished = [report, previous](const Option<Error>& error) {
    report(error);
    previous(error);
  };
}


string CommonOp::shortDesc() const
{
  CHECK(initialized);

  // E.g., "fuseops::GetInodeAttributesOp" -> "GetInodeAttributes".
  string name = demangle(typeid(*op).name());

  size_t separator = name.rfind("::");
  if (separator != string::npos) {
    name = name.substr(separator + 2);
  }

  if (name != "Op") {
    name = strings::remove(name, "Op", strings::Mode::SUFFIX);
  }

  // Include the inode the op applies to.
  return name + "(inode=" + stringify(hdr.node) + ")";
}


OpHeader CommonOp::header() const
{
  CHECK(initialized);

  return OpHeader(hdr.uid, hdr.gid);
}


const Context& CommonOp::context() const
{
  CHECK(initialized);

  return ctx;
}


void CommonOp::respondError(const Option<Error>& error)
{
  CHECK(error.isSome()) << "Expected an error to respond to "
                        << shortDesc() << " with";

  responding();

  logf("-> (%s) error: %s", shortDesc(), error.get().message);

  kernelRequest->respondError(error.get());

  finished(error);
}


void CommonOp::respondSuccess(AckRequest* request)
{
  CHECK_EQ(static_cast<Request*>(request), kernelRequest);

  responding();

  logf("-> (%s) OK", shortDesc());

  request->respond();

  finished(None());
}


void CommonOp::responding()
{
  CHECK(initialized) << "Op responded to before init";
  CHECK(!responded) << shortDesc() << " responded to twice";

  responded = true;
}


LogFunction glogLogger()
{
  // NOTE: glog attributes the line to this lambda; 'calldepth' is
  // only of use to sinks that unwind the stack themselves.
  return [](int calldepth, const string& message) {
    VLOG(1) << message;
  };
}

} // namespace fuseops {
