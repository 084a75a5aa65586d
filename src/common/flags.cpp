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

#include "common/flags.hpp"

namespace fuseops {
namespace internal {

Flags::Flags()
{
  add(&Flags::trace_by_pid,
      "trace_by_pid",
      "Enable a hacky mode that groups all ops from each individual PID\n"
      "under one trace. Not a good idea to use in production; it spawns\n"
      "a monitor per PID and leaks traces for PIDs it cannot probe.",
      false);

  add(&Flags::trace_file,
      "trace_file",
      "Path of the file to record finished trace spans to, one JSON\n"
      "object per line. Tracing is disabled when not set.");

  add(&Flags::liveness_poll_interval,
      "liveness_poll_interval",
      "How often to check whether a traced PID is still alive.",
      Milliseconds(50));
}

} // namespace internal {
} // namespace fuseops {
