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

#include <ostream>
#include <string>

#include <glog/logging.h>

#include <fuseops/ops.hpp>

using std::ostream;
using std::string;

namespace fuseops {

ostream& operator<<(ostream& stream, const InodeAttributes& attributes)
{
  return stream << "{size: " << attributes.size
                << ", nlink: " << attributes.nlink
                << ", mode: 0" << std::oct << attributes.mode << std::dec
                << ", uid: " << attributes.uid
                << ", gid: " << attributes.gid << "}";
}


ostream& operator<<(ostream& stream, const InodeAttributesResponse& response)
{
  return stream << "{attributes: " << response.attributes
                << ", attributes_ttl: " << response.attributesTTL << "}";
}


ostream& operator<<(ostream& stream, const ChildInodeEntry& entry)
{
  return stream << "{child: " << entry.child
                << ", generation: " << entry.generation
                << ", attributes: " << entry.attributes
                << ", attributes_ttl: " << entry.attributesTTL
                << ", entry_ttl: " << entry.entryTTL << "}";
}


LookUpInodeOp::LookUpInodeOp(
    const Context& context,
    LookUpInodeRequest* _request,
    const LogFunction& log,
    const FinishFunction& finished)
  : parent(CHECK_NOTNULL(_request)->header().node),
    name(_request->name()),
    request(_request)
{
  init(context, this, request, log, finished);
}


void LookUpInodeOp::respond(const Option<Error>& error)
{
  if (error.isSome()) {
    respondError(error);
    return;
  }

  respondSuccess(request, entry);
}


GetInodeAttributesOp::GetInodeAttributesOp(
    const Context& context,
    PayloadRequest<InodeAttributesResponse>* _request,
    const LogFunction& log,
    const FinishFunction& finished)
  : inode(CHECK_NOTNULL(_request)->header().node),
    request(_request)
{
  init(context, this, request, log, finished);
}


void GetInodeAttributesOp::respond(const Option<Error>& error)
{
  if (error.isSome()) {
    respondError(error);
    return;
  }

  InodeAttributesResponse response;
  response.attributes = attributes;
  response.attributesTTL = attributesTTL;

  respondSuccess(request, response);
}


ForgetInodeOp::ForgetInodeOp(
    const Context& context,
    ForgetInodeRequest* _request,
    const LogFunction& log,
    const FinishFunction& finished)
  : inode(CHECK_NOTNULL(_request)->header().node),
    count(_request->count()),
    request(_request)
{
  init(context, this, request, log, finished);
}


void ForgetInodeOp::respond(const Option<Error>& error)
{
  if (error.isSome()) {
    respondError(error);
    return;
  }

  respondSuccess(request);
}

} // namespace fuseops {
