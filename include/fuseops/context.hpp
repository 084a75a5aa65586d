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

#ifndef __FUSEOPS_CONTEXT_HPP__
#define __FUSEOPS_CONTEXT_HPP__

#include <atomic>
#include <memory>

#include <stout/option.hpp>

#include <fuseops/span.hpp>

namespace fuseops {

// The execution context an operation runs under. A context is a
// cheap, copyable handle: copies refer to the same underlying scope
// and compare equal. Deriving a context creates a new scope that is
// cancelled whenever any of its ancestors is cancelled.
class Context
{
public:
  // Returns a fresh root context carrying no trace.
  static Context background();

  // Returns a new scope under this one, carrying the same span.
  Context child() const;

  // Returns a new scope under this one, carrying 'span'.
  Context withSpan(const trace::Span& span) const;

  // The innermost span this context belongs to, if any.
  const Option<trace::Span>& span() const;

  // Cancels this scope and, transitively, every scope derived from it.
  void cancel() const;

  bool cancelled() const;

  bool operator==(const Context& that) const { return data == that.data; }
  bool operator!=(const Context& that) const { return data != that.data; }

private:
  struct Data
  {
    Data(const Option<trace::Span>& _span,
         const std::shared_ptr<Data>& _parent)
      : span(_span), parent(_parent), cancelled(false) {}

    const Option<trace::Span> span;
    const std::shared_ptr<Data> parent;
    std::atomic<bool> cancelled;
  };

  explicit Context(const std::shared_ptr<Data>& _data) : data(_data) {}

  std::shared_ptr<Data> data;
};

} // namespace fuseops {

#endif // __FUSEOPS_CONTEXT_HPP__
