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

#ifndef QSXFER_CLIENT_TRANSFERMANAGER_H_
#define QSXFER_CLIENT_TRANSFERMANAGER_H_

#include <string>
#include <vector>

#include "boost/function.hpp"
#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

#include "client/BucketOutcome.h"
#include "client/ObjectHandle.h"
#include "client/ObjectMetaData.h"
#include "client/QSError.h"
#include "client/TransferOptions.h"

namespace QSXfer {

namespace Client {

class Bucket;

typedef boost::function<void(const ClientError<QSError::Value> &,
                             const std::vector<ObjectHandle> &,
                             const std::vector<ObjectMetaData> &)>
    UploadMultiCallback;
typedef boost::function<void(const ClientError<QSError::Value> &,
                             const std::vector<Buffer> &)>
    DownloadMultiCallback;
typedef boost::function<void(const ClientError<QSError::Value> &,
                             const Buffer &)>
    DownloadCallback;

//
// TransferManager
//
// Runs many uploads or downloads, or the ranged chunks of one large object,
// against a bucket with a bounded number of requests in flight. Results come
// back in request order whatever the completion order was. When any item
// fails, all the other items still run to the end and the operation fails
// with the first error recorded; the results of the other items are dropped.
//
// Every operation blocks until all its requests have settled. The callback
// forms run the same operation and hand the outcome to the callback before
// returning; on success the error passed has code GOOD.
//
class TransferManager : private boost::noncopyable {
 public:
  // Throw QSXferException if bucket is null
  explicit TransferManager(const boost::shared_ptr<Bucket> &bucket);

  ~TransferManager() {}

 public:
  // Upload local files
  //
  // @param  : file paths, options
  // @return : outcome of {object handle, metadata} in file path order
  UploadMultiOutcome UploadMulti(
      const std::vector<std::string> &filePaths,
      const UploadMultiOptions &options = UploadMultiOptions()) const;

  void UploadMulti(const std::vector<std::string> &filePaths,
                   const UploadMultiOptions &options,
                   const UploadMultiCallback &callback) const;

  // Download objects
  //
  // @param  : objects, options
  // @return : outcome of contents in object order
  DownloadMultiOutcome DownloadMulti(
      const std::vector<ObjectHandle> &objects,
      const DownloadMultiOptions &options = DownloadMultiOptions()) const;

  void DownloadMulti(const std::vector<ObjectHandle> &objects,
                     const DownloadMultiOptions &options,
                     const DownloadMultiCallback &callback) const;

  // Download one object with parallel ranged requests
  //
  // @param  : object, options
  // @return : outcome of the whole content
  //
  // The content is also written to a local file named after the base name
  // of the object key, under options.m_destinationDirectory. Each chunk is
  // written at its own offset as soon as it arrives. The file is closed on
  // every path; bytes already written stay on disk when the download fails.
  DownloadOutcome DownloadLargeFile(
      const ObjectHandle &object,
      const LargeFileDownloadOptions &options =
          LargeFileDownloadOptions()) const;

  void DownloadLargeFile(const ObjectHandle &object,
                         const LargeFileDownloadOptions &options,
                         const DownloadCallback &callback) const;

  const boost::shared_ptr<Bucket> &GetBucket() const { return m_bucket; }

 private:
  boost::shared_ptr<Bucket> m_bucket;
};

}  // namespace Client
}  // namespace QSXfer

#endif  // QSXFER_CLIENT_TRANSFERMANAGER_H_
