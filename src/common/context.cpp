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

#include <fuseops/context.hpp>

namespace fuseops {

Context Context::background()
{
  return Context(std::make_shared<Data>(None(), nullptr));
}


Context Context::child() const
{
  return Context(std::make_shared<Data>(data->span, data));
}


Context Context::withSpan(const trace::Span& span) const
{
  return Context(std::make_shared<Data>(span, data));
}


const Option<trace::Span>& Context::span() const
{
  return data->span;
}


void Context::cancel() const
{
  data->cancelled.store(true);
}


bool Context::cancelled() const
{
  // Walk up to the root; a scope is cancelled if any ancestor is.
  for (Data* scope = data.get(); scope != NULL; scope = scope->parent.get()) {
    if (scope->cancelled.load()) {
      return true;
    }
  }

  return false;
}

} // namespace fuseops {
