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

#ifndef __FUSEOPS_REQUEST_HPP__
#define __FUSEOPS_REQUEST_HPP__

#include <stdint.h>

#include <sys/types.h>

#include <string>

#include <stout/error.hpp>

namespace fuseops {

typedef uint64_t InodeID;

// The root inode of every file system.
const InodeID ROOT_INODE_ID = 1;


// The fixed part of every request the kernel sends.
struct RequestHeader
{
  RequestHeader()
    : node(0), uid(0), gid(0), pid(0) {}

  RequestHeader(InodeID _node, uid_t _uid, gid_t _gid, pid_t _pid)
    : node(_node), uid(_uid), gid(_gid), pid(_pid) {}

  // The inode the request applies to.
  InodeID node;

  // Identity of the calling process.
  uid_t uid;
  gid_t gid;
  pid_t pid;
};


/**
 * A request decoded by the kernel transport. Every request must be
 * answered exactly once, either through 'respondError' or through
 * the success entry point of the capability interface below that
 * the concrete request implements.
 */
class Request
{
public:
  virtual ~Request() {}

  virtual RequestHeader header() const = 0;

  // Fails the request; the transport maps 'error' to an errno.
  virtual void respondError(const Error& error) = 0;
};


// A request the kernel expects to be answered with a bare
// acknowledgement.
class AckRequest : public Request
{
public:
  virtual ~AckRequest() {}

  virtual void respond() = 0;
};


// A request the kernel expects to be answered with a 'Response'.
template <typename Response>
class PayloadRequest : public Request
{
public:
  virtual ~PayloadRequest() {}

  virtual void respond(const Response& response) = 0;
};

} // namespace fuseops {

#endif // __FUSEOPS_REQUEST_HPP__
