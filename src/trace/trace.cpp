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

#include <fuseops/trace.hpp>

namespace fuseops {
namespace trace {

static void ignore(const Option<Error>&) {}


bool NoopTracer::enabled() const
{
  return false;
}


Trace NoopTracer::trace(const Context& parent, const std::string& label)
{
  return Trace(parent, &ignore);
}


Trace NoopTracer::startSpan(const Context& parent, const std::string& label)
{
  return Trace(parent, &ignore);
}


static NoopTracer* noop = new NoopTracer();

static Tracer* installed = noop;


Tracer* tracer()
{
  return installed;
}


void install(Tracer* tracer)
{
  installed = (tracer != NULL) ? tracer : noop;
}

} // namespace trace {
} // namespace fuseops {
