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

#include <gtest/gtest.h>

#include <stout/gtest.hpp>

#include <fuseops/context.hpp>
#include <fuseops/span.hpp>

namespace fuseops {
namespace internal {
namespace tests {

TEST(ContextTest, Identity)
{
  Context context = Context::background();
  Context copy = context;

  EXPECT_EQ(context, copy);
  EXPECT_NE(context, Context::background());
  EXPECT_NE(context, context.child());
}


TEST(ContextTest, Span)
{
  Context root = Context::background();
  EXPECT_NONE(root.span());

  trace::Span span("root");
  Context traced = root.withSpan(span);

  ASSERT_SOME(traced.span());
  EXPECT_EQ(span.id, traced.span().get().id);
  EXPECT_EQ("root", traced.span().get().label);

  // Children inherit the innermost span.
  ASSERT_SOME(traced.child().span());
  EXPECT_EQ(span.id, traced.child().span().get().id);

  trace::Span child(span, "child");
  EXPECT_SOME_EQ(span.id, child.parent);
  EXPECT_EQ(span.traceId, child.traceId);
}


TEST(ContextTest, Cancel)
{
  Context root = Context::background();
  Context child = root.child();
  Context grandchild = child.withSpan(trace::Span("span"));

  child.cancel();

  EXPECT_FALSE(root.cancelled());
  EXPECT_TRUE(child.cancelled());
  EXPECT_TRUE(grandchild.cancelled());

  root.cancel();

  EXPECT_TRUE(root.cancelled());
}

} // namespace tests {
} // namespace internal {
} // namespace fuseops {
