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

#ifndef QSXFER_CLIENT_QSSDKERROR_H_
#define QSXFER_CLIENT_QSSDKERROR_H_

#include <string>

#include "qingstor/HttpCommon.h"
#include "qingstor/QsErrors.h"
#include "qingstor/Types.h"  // for sdk QsOutput

#include "client/ClientError.hpp"
#include "client/QSError.h"

namespace QSXfer {

namespace Client {

QSError::Value SDKErrorToQSError(QsError sdkErr);
QSError::Value SDKResponseToQSError(QsError sdkErr,
                                    QingStor::Http::HttpResponseCode code);
bool SDKShouldRetry(QsError sdkErr, QingStor::Http::HttpResponseCode code);

// The sdk returns UNEXPECTED_RESPONSE for codes its api specs do not list,
// so successful codes are accepted here as well.
bool SDKResponseSuccess(QsError sdkErr, QingStor::Http::HttpResponseCode code);

// @return : string in form of "NotFound(404)"
std::string SDKResponseCodeToString(QingStor::Http::HttpResponseCode code);

// Build error from a failed sdk request
//
// @param  : sdk error, operation name, sdk output
// @return : client error
ClientError<QSError::Value> BuildQSError(QsError sdkErr,
                                         const std::string &exceptionName,
                                         const QingStor::QsOutput &output);

}  // namespace Client
}  // namespace QSXfer

#endif  // QSXFER_CLIENT_QSSDKERROR_H_
