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

#ifndef __FUSEOPS_TESTS_UTILS_HPP__
#define __FUSEOPS_TESTS_UTILS_HPP__

#include <errno.h>

#include <sys/types.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <process/clock.hpp>

#include <stout/duration.hpp>
#include <stout/error.hpp>
#include <stout/gtest.hpp>
#include <stout/hashmap.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/synchronized.hpp>
#include <stout/try.hpp>

#include <fuseops/context.hpp>
#include <fuseops/span.hpp>
#include <fuseops/trace.hpp>

#include "trace/registry.hpp"

namespace fuseops {
namespace internal {
namespace tests {

// Runs each test in a fresh temporary directory, which is also the
// current working directory for the duration of the test.
class TemporaryDirectoryTest : public ::testing::Test
{
protected:
  virtual void SetUp()
  {
    cwd = os::getcwd();

    Try<std::string> directory = os::mkdtemp();
    ASSERT_SOME(directory) << "Failed to mkdtemp";

    sandbox = directory.get();

    ASSERT_SOME(os::chdir(sandbox.get()));
  }

  virtual void TearDown()
  {
    ASSERT_SOME(os::chdir(cwd));

    if (sandbox.isSome()) {
      ASSERT_SOME(os::rmdir(sandbox.get()));
      sandbox = None();
    }
  }

  Option<std::string> sandbox;

private:
  std::string cwd;
};


// A tracer that remembers the spans it started and the reports it
// received, in order.
class RecordingTracer : public trace::Tracer
{
public:
  struct Report
  {
    Report(const std::string& _label, const Option<Error>& _error)
      : label(_label), error(_error) {}

    std::string label;
    Option<Error> error;
  };

  RecordingTracer() : data(new Data()) {}

  virtual ~RecordingTracer() {}

  virtual bool enabled() const
  {
    return true;
  }

  virtual trace::Trace trace(const Context& parent, const std::string& label)
  {
    if (parent.span().isSome()) {
      return start(parent, trace::Span(parent.span().get(), label));
    }

    return start(parent, trace::Span(label));
  }

  virtual trace::Trace startSpan(
      const Context& parent,
      const std::string& label)
  {
    if (parent.span().isNone()) {
      return trace::Trace(parent, [](const Option<Error>&) {});
    }

    return start(parent, trace::Span(parent.span().get(), label));
  }

  std::vector<std::string> started() const
  {
    std::vector<std::string> result;
    synchronized (data->mutex) {
      result = data->started;
    }
    return result;
  }

  std::vector<Report> reports() const
  {
    std::vector<Report> result;
    synchronized (data->mutex) {
      result = data->reports;
    }
    return result;
  }

private:
  struct Data
  {
    std::mutex mutex;
    std::vector<std::string> started;
    std::vector<Report> reports;
  };

  trace::Trace start(const Context& parent, const trace::Span& span)
  {
    synchronized (data->mutex) {
      data->started.push_back(span.label);
    }

    std::shared_ptr<Data> data_ = data;
    const std::string label = span.label;

    return trace::Trace(
        parent.withSpan(span),
        [data_, label](const Option<Error>& error) {
          synchronized (data_->mutex) {
            data_->reports.push_back(Report(label, error));
          }
        });
  }

  std::shared_ptr<Data> data;
};


// Stands in for the kernel's process table when probing liveness.
// PIDs are alive until told otherwise.
class ProcessTable
{
public:
  ProcessTable() : data(new Data()) {}

  // Makes probes of 'pid' fail with 'error', e.g. ESRCH once the
  // process has exited.
  void set(pid_t pid, int error)
  {
    synchronized (data->mutex) {
      data->errors[pid] = error;
    }
  }

  // Makes every PID appear to have exited.
  void exitAll()
  {
    synchronized (data->mutex) {
      data->exited = true;
    }
  }

  // How many times 'pid' has been probed.
  int probes(pid_t pid) const
  {
    int count = 0;
    synchronized (data->mutex) {
      count = data->probes.get(pid).getOrElse(0);
    }
    return count;
  }

  LivenessProbe probe() const
  {
    std::shared_ptr<Data> data_ = data;

    return [data_](pid_t pid) -> int {
      int error = 0;
      synchronized (data_->mutex) {
        data_->probes[pid]++;
        error = data_->exited
          ? ESRCH
          : data_->errors.get(pid).getOrElse(0);
      }
      return error;
    };
  }

private:
  struct Data
  {
    Data() : exited(false) {}

    std::mutex mutex;
    hashmap<pid_t, int> errors;
    hashmap<pid_t, int> probes;
    bool exited;
  };

  std::shared_ptr<Data> data;
};


// Installs a RecordingTracer and a registry probing a ProcessTable
// for each test, with the libprocess clock paused. Every monitored
// PID is made to exit at the end of the test.
class TracingTest : public ::testing::Test
{
protected:
  TracingTest() : interval(Milliseconds(50)) {}

  virtual void SetUp()
  {
    process::Clock::pause();

    trace::install(&tracer);

    group(false);
  }

  virtual void TearDown()
  {
    table.exitAll();

    process::Clock::advance(interval);
    process::Clock::settle();
    process::Clock::resume();

    trace::install(NULL);

    TraceRegistry::install(new TraceRegistry(trace::tracer(), false));
  }

  // Installs a process-wide registry that groups by PID if 'enabled'.
  void group(bool enabled)
  {
    TraceRegistry::install(
        new TraceRegistry(&tracer, enabled, interval, table.probe()));
  }

  const Duration interval;

  RecordingTracer tracer;
  ProcessTable table;
};

} // namespace tests {
} // namespace internal {
} // namespace fuseops {

#endif // __FUSEOPS_TESTS_UTILS_HPP__
