// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#ifndef QSXFER_CLIENT_BUCKET_H_
#define QSXFER_CLIENT_BUCKET_H_

#include <string>

#include "boost/noncopyable.hpp"

#include "client/BucketOutcome.h"
#include "client/ObjectHandle.h"
#include "client/TransferOptions.h"

namespace QSXfer {

namespace Client {

//
// Bucket
//
// Per object operations of one bucket of the object store. TransferManager
// calls them concurrently from its worker threads, so implementations must be
// thread safe. Errors are reported through the outcome; a std::exception
// escaping from a call is taken as an UNKNOWN error of that call.
//
class Bucket : private boost::noncopyable {
 public:
  Bucket() {}
  virtual ~Bucket() {}

 public:
  // Upload a local file
  //
  // @param  : local file path, upload options
  // @return : handle and metadata of the created object
  //
  // The object key is options.m_destination, or the base name of the file
  // when it is empty.
  virtual UploadOutcome Upload(const std::string &filePath,
                               const UploadOptions &options) = 0;

  // Download an object or a range of it
  //
  // @param  : object, download options
  // @return : content bytes
  //
  // When options.m_destination is set the content is also written to that
  // local path.
  virtual DownloadOutcome Download(const ObjectHandle &object,
                                   const DownloadOptions &options) = 0;

  // Get object metadata
  //
  // @param  : object
  // @return : metadata carrying the authoritative size
  virtual GetMetadataOutcome GetMetadata(const ObjectHandle &object) = 0;

  virtual const std::string &GetName() const = 0;
};

}  // namespace Client
}  // namespace QSXfer

#endif  // QSXFER_CLIENT_BUCKET_H_
