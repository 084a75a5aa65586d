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

#ifndef __FUSEOPS_OPS_HPP__
#define __FUSEOPS_OPS_HPP__

#include <stdint.h>

#include <sys/types.h>

#include <ostream>
#include <string>

#include <glog/logging.h>

#include <stout/duration.hpp>
#include <stout/error.hpp>
#include <stout/format.hpp>
#include <stout/lambda.hpp>
#include <stout/none.hpp>
#include <stout/option.hpp>
#include <stout/stringify.hpp>
#include <stout/try.hpp>

#include <fuseops/context.hpp>
#include <fuseops/request.hpp>
#include <fuseops/trace.hpp>

namespace fuseops {

// Receives one log line about an op. The first argument is the
// number of stack frames between the sink and the code that logged.
typedef lambda::function<void(int, const std::string&)> LogFunction;

// Invoked once an op has been responded to, with the error it was
// responded to with (if any).
typedef lambda::function<void(const Option<Error>&)> FinishFunction;


// Identity of the process on whose behalf an op is issued.
struct OpHeader
{
  OpHeader(uid_t _uid, gid_t _gid) : uid(_uid), gid(_gid) {}

  uid_t uid;
  gid_t gid;
};


class Op
{
public:
  virtual ~Op() {}

  // A short description of the op, e.g. "LookUpInode(inode=1)".
  virtual std::string shortDesc() const = 0;

  virtual OpHeader header() const = 0;

  // The context the file system should run the op under.
  virtual const Context& context() const = 0;

  // Responds to the kernel with 'error' if one is given, or with the
  // op's output fields otherwise. Must be called exactly once.
  virtual void respond(const Option<Error>& error) = 0;
};


/**
 * Behavior shared by all ops: binds the kernel request to a context,
 * a trace span, a log sink and a completion callback, and routes the
 * response back to the kernel.
 *
 * A concrete op calls 'init' from its constructor and later answers
 * through exactly one of 'respondError' or 'respondSuccess'. The
 * request must stay alive until then.
 */
class CommonOp : public Op
{
public:
  virtual ~CommonOp() {}

  virtual std::string shortDesc() const;

  virtual OpHeader header() const;

  virtual const Context& context() const;

  template <typename... T>
  void logf(const std::string& format, const T&... args) const;

protected:
  CommonOp();

  // Must be called exactly once, before anything else.
  void init(
      const Context& context,
      const Op* op,
      Request* request,
      const LogFunction& log,
      const FinishFunction& finished);

  // Fails the op. Aborts if 'error' is none.
  void respondError(const Option<Error>& error);

  // Completes an op the kernel expects no payload for.
  void respondSuccess(AckRequest* request);

  // Completes an op with 'response', which must be the payload type
  // the request is answered with.
  template <typename Response>
  void respondSuccess(
      PayloadRequest<Response>* request,
      const Response& response);

private:
  CommonOp(const CommonOp&); // Not copyable.
  CommonOp& operator=(const CommonOp&); // Not assignable.

  // Checks the op is initialized and not yet responded to.
  void responding();

  bool initialized;
  bool responded;

  Context ctx;
  const Op* op;
  Request* kernelRequest;

  // Copied at init, so it outlives the request.
  RequestHeader hdr;

  LogFunction log;
  FinishFunction finished;
};


template <typename... T>
void CommonOp::logf(const std::string& format, const T&... args) const
{
  // Attribute the line to whoever called logf.
  const int calldepth = 2;

  Try<std::string> message = strings::format(format, args...);
  if (message.isError()) {
    log(calldepth, "Failed to format '" + format + "': " + message.error());
    return;
  }

  log(calldepth, message.get());
}


template <typename Response>
void CommonOp::respondSuccess(
    PayloadRequest<Response>* request,
    const Response& response)
{
  CHECK_EQ(static_cast<Request*>(request), kernelRequest);

  responding();

  logf("-> %s", stringify(response));

  request->respond(response);

  finished(None());
}


// A LogFunction that writes op log lines through glog.
LogFunction glogLogger();


////////////////////////////////////////////////////////////////////////
// Inodes
////////////////////////////////////////////////////////////////////////

struct InodeAttributes
{
  InodeAttributes()
    : size(0), nlink(0), mode(0), uid(0), gid(0) {}

  uint64_t size;
  uint32_t nlink;
  mode_t mode;
  uid_t uid;
  gid_t gid;
};


struct InodeAttributesResponse
{
  InodeAttributes attributes;

  // How long the kernel may cache 'attributes'.
  Duration attributesTTL;
};


struct ChildInodeEntry
{
  ChildInodeEntry() : child(0), generation(0) {}

  InodeID child;

  // Distinguishes reuses of the same inode number; must never
  // decrease for a given 'child'.
  uint64_t generation;

  InodeAttributes attributes;
  Duration attributesTTL;

  // How long the kernel may cache the name -> 'child' mapping.
  Duration entryTTL;
};


std::ostream& operator<<(std::ostream& stream, const InodeAttributes& a);

std::ostream& operator<<(
    std::ostream& stream,
    const InodeAttributesResponse& response);

std::ostream& operator<<(std::ostream& stream, const ChildInodeEntry& entry);


class LookUpInodeRequest : public PayloadRequest<ChildInodeEntry>
{
public:
  virtual ~LookUpInodeRequest() {}

  // The name of the child being looked up.
  virtual std::string name() const = 0;
};


class ForgetInodeRequest : public AckRequest
{
public:
  virtual ~ForgetInodeRequest() {}

  // The number of lookups the kernel is dropping.
  virtual uint64_t count() const = 0;
};


// Look up a child by name within a parent directory. The kernel
// holds a lookup reference on the child until a matching
// ForgetInodeOp.
class LookUpInodeOp : public CommonOp
{
public:
  LookUpInodeOp(
      const Context& context,
      LookUpInodeRequest* request,
      const LogFunction& log,
      const FinishFunction& finished);

  virtual void respond(const Option<Error>& error);

  const InodeID parent;
  const std::string name;

  // Filled in by the file system on success.
  ChildInodeEntry entry;

private:
  LookUpInodeRequest* request;
};


// Refresh the attributes of an inode the kernel already knows.
class GetInodeAttributesOp : public CommonOp
{
public:
  GetInodeAttributesOp(
      const Context& context,
      PayloadRequest<InodeAttributesResponse>* request,
      const LogFunction& log,
      const FinishFunction& finished);

  virtual void respond(const Option<Error>& error);

  const InodeID inode;

  // Filled in by the file system on success.
  InodeAttributes attributes;
  Duration attributesTTL;

private:
  PayloadRequest<InodeAttributesResponse>* request;
};


// The kernel dropped 'count' lookup references to an inode.
class ForgetInodeOp : public CommonOp
{
public:
  ForgetInodeOp(
      const Context& context,
      ForgetInodeRequest* request,
      const LogFunction& log,
      const FinishFunction& finished);

  virtual void respond(const Option<Error>& error);

  const InodeID inode;
  const uint64_t count;

private:
  ForgetInodeRequest* request;
};

} // namespace fuseops {

#endif // __FUSEOPS_OPS_HPP__
