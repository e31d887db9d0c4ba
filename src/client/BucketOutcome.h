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

#ifndef QSXFER_CLIENT_BUCKETOUTCOME_H_
#define QSXFER_CLIENT_BUCKETOUTCOME_H_

#include <utility>
#include <vector>

#include "boost/shared_ptr.hpp"

#include "client/ObjectHandle.h"
#include "client/ObjectMetaData.h"
#include "client/Outcome.hpp"
#include "client/QSError.h"

namespace QSXfer {

namespace Client {

// Object content. Shared so results move between threads without copying.
typedef boost::shared_ptr<std::vector<char> > Buffer;

typedef std::pair<ObjectHandle, ObjectMetaData> UploadResponse;

typedef Outcome<UploadResponse, ClientError<QSError::Value> > UploadOutcome;
typedef Outcome<Buffer, ClientError<QSError::Value> > DownloadOutcome;
typedef Outcome<ObjectMetaData, ClientError<QSError::Value> >
    GetMetadataOutcome;

typedef Outcome<std::vector<UploadResponse>, ClientError<QSError::Value> >
    UploadMultiOutcome;
typedef Outcome<std::vector<Buffer>, ClientError<QSError::Value> >
    DownloadMultiOutcome;

}  // namespace Client
}  // namespace QSXfer

#endif  // QSXFER_CLIENT_BUCKETOUTCOME_H_
