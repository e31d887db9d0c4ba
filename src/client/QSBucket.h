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

#ifndef QSXFER_CLIENT_QSBUCKET_H_
#define QSXFER_CLIENT_QSBUCKET_H_

#include <string>

#include "boost/shared_ptr.hpp"

#include "qingstor/Bucket.h"
#include "qingstor/QsConfig.h"

#include "client/Bucket.h"

namespace QSXfer {

namespace Client {

//
// QSBucket
//
// Bucket backed by the QingStor sdk. The sdk must have been initialized
// (QingStor::InitializeSDK) before any call and outlive this object.
//
// QingStor has no object generations, so an upload carrying any generation
// precondition fails with PRECONDITION_NOT_SUPPORTED without being sent.
//
class QSBucket : public Bucket {
 public:
  QSBucket(const QingStor::QsConfig &config, const std::string &bucketName,
           const std::string &zone);

  ~QSBucket() {}

 public:
  UploadOutcome Upload(const std::string &filePath,
                       const UploadOptions &options);
  DownloadOutcome Download(const ObjectHandle &object,
                           const DownloadOptions &options);
  GetMetadataOutcome GetMetadata(const ObjectHandle &object);

  const std::string &GetName() const { return m_bucketName; }

 private:
  std::string m_bucketName;
  boost::shared_ptr<QingStor::Bucket> m_bucket;
};

}  // namespace Client
}  // namespace QSXfer

#endif  // QSXFER_CLIENT_QSBUCKET_H_
