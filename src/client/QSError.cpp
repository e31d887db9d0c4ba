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

#include "client/QSError.h"

#include <string.h>  // for strcmp

#include <string>
#include <utility>

namespace QSXfer {

namespace Client {

using std::make_pair;
using std::pair;
using std::string;

namespace {

typedef pair<QSError::Value, const char *> ErrorNamePair;

const ErrorNamePair *GetErrorNames(int *count) {
  static const ErrorNamePair errToNames[] = {
      // keep sorted
      make_pair(QSError::UNKNOWN, "Unknow"),
      make_pair(QSError::GOOD, "Good"),
      make_pair(QSError::CANCELLED, "Cancelled"),
      make_pair(QSError::FILE_IO_ERROR, "FileIOError"),
      make_pair(QSError::NOT_FOUND, "NotFound"),
      make_pair(QSError::PARAMETER_INVALID, "ParameterInvalid"),
      make_pair(QSError::PARAMETER_MISSING, "ParameterMissing"),
      make_pair(QSError::PRECONDITION_FAILED, "PreconditionFailed"),
      make_pair(QSError::PRECONDITION_NOT_SUPPORTED,
                "PreconditionNotSupported"),
      make_pair(QSError::SDK_CONFIGURE_FILE_INAVLID, "SDKConfigureFileInvalid"),
      make_pair(QSError::SDK_NO_REQUIRED_PARAMETER, "SDKNoRequiredParameter"),
      make_pair(QSError::SDK_REQUEST_SEND_ERROR, "SDKRequestSendError"),
      make_pair(QSError::SDK_UNEXPECTED_RESPONSE, "SDKUnexpectedResponse"),
      make_pair(QSError::SDK_SIGN_WITH_INVAILD_KEY, "SDKSignWithInvalidKey"),
  };
  *count = sizeof(errToNames) / sizeof(errToNames[0]);
  return errToNames;
}

}  // namespace

// --------------------------------------------------------------------------
QSError::Value StringToQSError(const string &errorCode) {
  int n = 0;
  const ErrorNamePair *errToNames = GetErrorNames(&n);
  for (int i = 0; i < n; ++i) {
    if (strcmp(errorCode.c_str(), errToNames[i].second) == 0) {
      return errToNames[i].first;
    }
  }
  return QSError::UNKNOWN;
}

// --------------------------------------------------------------------------
string QSErrorToString(QSError::Value err) {
  int n = 0;
  const ErrorNamePair *errToNames = GetErrorNames(&n);
  // binary search
  int low = 0;
  int high = n - 1;
  while (low <= high) {
    int mid = (low + high) / 2;
    if (err == errToNames[mid].first) {
      return errToNames[mid].second;
    }
    if (static_cast<int>(err) < static_cast<int>(errToNames[mid].first)) {
      high = mid - 1;
    } else {
      low = mid + 1;
    }
  }
  return "Unknow";
}

// --------------------------------------------------------------------------
string GetMessageForQSError(const ClientError<QSError::Value> &error) {
  return QSErrorToString(error.GetError()) + ", " + error.GetExceptionName() +
         ":" + error.GetMessage();
}

// --------------------------------------------------------------------------
bool IsGoodQSError(const ClientError<QSError::Value> &error) {
  return error.GetError() == QSError::GOOD;
}

}  // namespace Client
}  // namespace QSXfer
