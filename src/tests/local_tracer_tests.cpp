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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <process/gtest.hpp>
#include <process/owned.hpp>

#include <stout/check.hpp>
#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/json.hpp>
#include <stout/none.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/result.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include <fuseops/context.hpp>
#include <fuseops/trace.hpp>

#include "trace/local.hpp"

#include "tests/utils.hpp"

using namespace process;

using std::string;
using std::vector;

namespace fuseops {
namespace internal {
namespace tests {

// Returns the string stored under 'key', if there is one.
static Option<string> value(const JSON::Object& object, const string& key)
{
  Result<JSON::String> result = object.find<JSON::String>(key);
  if (!result.isSome()) {
    return None();
  }

  return result.get().value;
}


class LocalTracerTest : public TemporaryDirectoryTest
{
protected:
  Owned<LocalTracer> create()
  {
    Try<LocalTracer*> tracer = LocalTracer::create(traces());
    CHECK_SOME(tracer);
    return Owned<LocalTracer>(tracer.get());
  }

  string traces() const
  {
    return path::join(sandbox.get(), "traces");
  }

  // Parses every recorded span, in the order they were reported.
  vector<JSON::Object> spans() const
  {
    vector<JSON::Object> result;

    Try<string> contents = os::read(traces());
    EXPECT_SOME(contents);
    if (contents.isError()) {
      return result;
    }

    foreach (const string& line, strings::tokenize(contents.get(), "\n")) {
      Try<JSON::Object> object = JSON::parse<JSON::Object>(line);
      EXPECT_SOME(object);
      if (object.isSome()) {
        result.push_back(object.get());
      }
    }

    return result;
  }
};


TEST_F(LocalTracerTest, RecordsSpans)
{
  Owned<LocalTracer> tracer = create();

  EXPECT_TRUE(tracer->enabled());

  trace::Trace root =
    tracer->trace(Context::background(), "Requests from PID 7");

  trace::Trace child =
    tracer->startSpan(root.context, "LookUpInode(inode=1)");

  child.report(Error("ENOENT"));
  root.report(None());

  AWAIT_READY(tracer->flush());

  vector<JSON::Object> spans = this->spans();
  ASSERT_EQ(2u, spans.size());

  EXPECT_SOME_EQ("LookUpInode(inode=1)", value(spans[0], "label"));
  EXPECT_SOME_EQ("ENOENT", value(spans[0], "error"));

  EXPECT_SOME_EQ("Requests from PID 7", value(spans[1], "label"));
  EXPECT_NONE(value(spans[1], "error"));

  // The root has no parent; the child's parent is the root.
  EXPECT_NONE(value(spans[1], "span_parent"));
  EXPECT_SOME_EQ(
      value(spans[1], "span_id").get(),
      value(spans[0], "span_parent"));

  ASSERT_SOME(value(spans[0], "trace_id"));
  EXPECT_SOME_EQ(
      value(spans[0], "trace_id").get(),
      value(spans[1], "trace_id"));

  EXPECT_SOME_EQ(stringify(root.context.span().get().traceId),
                 value(spans[1], "trace_id"));
}


TEST_F(LocalTracerTest, NestedTraceJoinsParent)
{
  Owned<LocalTracer> tracer = create();

  trace::Trace outer = tracer->trace(Context::background(), "connection");
  trace::Trace inner = tracer->trace(outer.context, "Requests from PID 7");

  ASSERT_SOME(inner.context.span());
  EXPECT_EQ(outer.context.span().get().traceId,
            inner.context.span().get().traceId);
  EXPECT_SOME_EQ(outer.context.span().get().id,
                 inner.context.span().get().parent);
}


TEST_F(LocalTracerTest, StartSpanWithoutTrace)
{
  Owned<LocalTracer> tracer = create();

  Context parent = Context::background();

  trace::Trace trace = tracer->startSpan(parent, "LookUpInode(inode=1)");

  EXPECT_EQ(parent, trace.context);

  trace.report(None());

  AWAIT_READY(tracer->flush());

  EXPECT_TRUE(spans().empty());
}


TEST_F(LocalTracerTest, RecordsPendingSpansOnDestruction)
{
  Try<LocalTracer*> tracer = LocalTracer::create(traces());
  ASSERT_SOME(tracer);

  trace::Trace root =
    tracer.get()->trace(Context::background(), "Requests from PID 7");

  for (int i = 0; i < 10; i++) {
    tracer.get()->startSpan(root.context, "ForgetInode(inode=1)").report(None());
  }

  root.report(None());

  delete tracer.get();

  EXPECT_EQ(11u, spans().size());
}


TEST_F(LocalTracerTest, CreateFails)
{
  EXPECT_ERROR(LocalTracer::create(
      path::join(sandbox.get(), "missing", "traces")));
}

} // namespace tests {
} // namespace internal {
} // namespace fuseops {
