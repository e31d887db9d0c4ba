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

#include "client/QSSDKError.h"

#include <string>

#include "boost/exception/to_string.hpp"

#include "qingstor/HttpCommon.h"
#include "qingstor/QsErrors.h"
#include "qingstor/Types.h"

namespace QSXfer {

namespace Client {

using boost::to_string;
using QingStor::Http::HttpResponseCode;
using std::string;

namespace {

struct ResponseCodeInfo {
  HttpResponseCode m_code;
  const char *m_name;
  int m_number;
};

// --------------------------------------------------------------------------
const ResponseCodeInfo *FindResponseCode(HttpResponseCode code) {
  using namespace QingStor::Http;  // NOLINT
  static const ResponseCodeInfo codes[] = {
      {REQUEST_NOT_MADE, "RequestNotMade", 0},
      {CONTINUE, "Continue", 100},
      {PROCESSING, "Processing", 102},
      {OK, "Ok", 200},
      {CREATED, "Created", 201},
      {ACCEPTED, "Accepted", 202},
      {NO_CONTENT, "NoContent", 204},
      {PARTIAL_CONTENT, "PartialContent", 206},
      {MOVED_PERMANENTLY, "MovedPermanently", 301},
      {FOUND, "Found", 302},
      {NOT_MODIFIED, "NotModified", 304},
      {BAD_REQUEST, "BadRequest", 400},
      {UNAUTHORIZED_OR_EXPIRED, "UnauthorizedOrExpired", 401},
      {FORBIDDEN, "Forbidden", 403},
      {NOT_FOUND, "NotFound", 404},
      {METHOD_NOT_ALLOWED, "MethodNotAllowed", 405},
      {CONFLICT, "Conflict", 409},
      {PRECONDITION_FAILED, "PreconditionFailed", 412},
      {INVALID_RANGE, "InvalidRange", 416},
      {TOO_MANY_REQUESTS, "TooManyRequests", 429},
      {INTERNAL_SERVER_ERROR, "InternalServerError", 500},
      {SERVICE_UNAVAILABLE, "ServiceUnavailable", 503},
      {GATEWAY_TIMEOUT, "GatewayTimeout", 504},
      {NETWORK_READ_TIMEOUT, "NetworkReadTimeout", 598},
      {NETWORK_CONNECT_TIMEOUT, "NetworkConnectTimeout", 599},
  };

  int n = sizeof(codes) / sizeof(codes[0]);
  for (int i = 0; i < n; ++i) {
    if (codes[i].m_code == code) {
      return &codes[i];
    }
  }
  return NULL;
}

// --------------------------------------------------------------------------
bool SDKResponseCodeSuccess(HttpResponseCode code) {
  const ResponseCodeInfo *info = FindResponseCode(code);
  return info != NULL && info->m_number >= 100 && info->m_number < 400;
}

}  // namespace

// --------------------------------------------------------------------------
QSError::Value SDKErrorToQSError(QsError sdkErr) {
  switch (sdkErr) {
    case QS_ERR_NO_ERROR:
      return QSError::GOOD;
    case QS_ERR_INVAILD_CONFIG_FILE:
      return QSError::SDK_CONFIGURE_FILE_INAVLID;
    case QS_ERR_NO_REQUIRED_PARAMETER:
      return QSError::SDK_NO_REQUIRED_PARAMETER;
    case QS_ERR_SEND_REQUEST_ERROR:
      return QSError::SDK_REQUEST_SEND_ERROR;
    case QS_ERR_UNEXCEPTED_RESPONSE:
      return QSError::SDK_UNEXPECTED_RESPONSE;
    case QS_ERR_SIGN_WITH_INVAILD_KEY:
      return QSError::SDK_SIGN_WITH_INVAILD_KEY;
    default:
      return QSError::UNKNOWN;
  }
}

// --------------------------------------------------------------------------
QSError::Value SDKResponseToQSError(QsError sdkErr, HttpResponseCode code) {
  QSError::Value err = SDKErrorToQSError(sdkErr);
  if (err != QSError::SDK_UNEXPECTED_RESPONSE) {
    return err;
  }

  if (code == QingStor::Http::NOT_FOUND) {
    return QSError::NOT_FOUND;
  } else if (code == QingStor::Http::PRECONDITION_FAILED) {
    return QSError::PRECONDITION_FAILED;
  } else if (SDKResponseCodeSuccess(code)) {
    return QSError::GOOD;
  }
  return QSError::SDK_UNEXPECTED_RESPONSE;
}

// --------------------------------------------------------------------------
bool SDKShouldRetry(QsError sdkErr, HttpResponseCode code) {
  if (sdkErr == QS_ERR_SEND_REQUEST_ERROR) {
    return true;
  }
  const ResponseCodeInfo *info = FindResponseCode(code);
  return info != NULL && (info->m_number >= 500 || info->m_number == 429);
}

// --------------------------------------------------------------------------
bool SDKResponseSuccess(QsError sdkErr, HttpResponseCode code) {
  return sdkErr == QS_ERR_NO_ERROR ||
         (sdkErr == QS_ERR_UNEXCEPTED_RESPONSE && SDKResponseCodeSuccess(code));
}

// --------------------------------------------------------------------------
string SDKResponseCodeToString(HttpResponseCode code) {
  const ResponseCodeInfo *info = FindResponseCode(code);
  if (info == NULL) {
    return "UnknownQingStorResponseCode(" +
           to_string(static_cast<int>(code)) + ")";
  }
  return string(info->m_name) + "(" + to_string(info->m_number) + ")";
}

// --------------------------------------------------------------------------
ClientError<QSError::Value> BuildQSError(QsError sdkErr,
                                         const string &exceptionName,
                                         const QingStor::QsOutput &output) {
  HttpResponseCode rspCode =
      const_cast<QingStor::QsOutput &>(output).GetResponseCode();
  QSError::Value err = SDKResponseToQSError(sdkErr, rspCode);
  bool retryable = SDKShouldRetry(sdkErr, rspCode);

  string errMsg = SDKResponseCodeToString(rspCode);
  if (sdkErr == QS_ERR_UNEXCEPTED_RESPONSE) {
    QingStor::ResponseErrorInfo errInfo = output.GetResponseErrInfo();
    errMsg += "[code:" + errInfo.code;
    errMsg += "; message:" + errInfo.message;
    errMsg += "; request:" + errInfo.requestID;
    errMsg += "; url:" + errInfo.url;
    errMsg += "]";
  }
  return ClientError<QSError::Value>(err, exceptionName, errMsg, retryable);
}

}  // namespace Client
}  // namespace QSXfer
