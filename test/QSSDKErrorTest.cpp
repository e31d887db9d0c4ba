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

#include <string>

#include "gtest/gtest.h"

#include "qingstor/HttpCommon.h"
#include "qingstor/QsErrors.h"

#include "client/QSError.h"
#include "client/QSSDKError.h"

namespace {

using QSXfer::Client::QSError;
using QSXfer::Client::SDKErrorToQSError;
using QSXfer::Client::SDKResponseCodeToString;
using QSXfer::Client::SDKResponseSuccess;
using QSXfer::Client::SDKResponseToQSError;
using QSXfer::Client::SDKShouldRetry;
using std::string;

}  // namespace

TEST(QSSDKErrorTest, SDKError) {
  EXPECT_EQ(QSError::GOOD, SDKErrorToQSError(QS_ERR_NO_ERROR));
  EXPECT_EQ(QSError::SDK_REQUEST_SEND_ERROR,
            SDKErrorToQSError(QS_ERR_SEND_REQUEST_ERROR));
  EXPECT_EQ(QSError::SDK_UNEXPECTED_RESPONSE,
            SDKErrorToQSError(QS_ERR_UNEXCEPTED_RESPONSE));
}

TEST(QSSDKErrorTest, ResponseCode) {
  using namespace QingStor::Http;  // NOLINT
  EXPECT_EQ(QSError::NOT_FOUND,
            SDKResponseToQSError(QS_ERR_UNEXCEPTED_RESPONSE, NOT_FOUND));
  EXPECT_EQ(QSError::PRECONDITION_FAILED,
            SDKResponseToQSError(QS_ERR_UNEXCEPTED_RESPONSE,
                                 PRECONDITION_FAILED));
  EXPECT_EQ(QSError::GOOD,
            SDKResponseToQSError(QS_ERR_UNEXCEPTED_RESPONSE, PARTIAL_CONTENT));
  EXPECT_EQ(QSError::SDK_UNEXPECTED_RESPONSE,
            SDKResponseToQSError(QS_ERR_UNEXCEPTED_RESPONSE, BAD_REQUEST));

  EXPECT_TRUE(SDKResponseSuccess(QS_ERR_NO_ERROR, OK));
  EXPECT_TRUE(SDKResponseSuccess(QS_ERR_UNEXCEPTED_RESPONSE, NO_CONTENT));
  EXPECT_FALSE(SDKResponseSuccess(QS_ERR_UNEXCEPTED_RESPONSE, FORBIDDEN));
  EXPECT_FALSE(SDKResponseSuccess(QS_ERR_SEND_REQUEST_ERROR, OK));
}

TEST(QSSDKErrorTest, Retry) {
  using namespace QingStor::Http;  // NOLINT
  EXPECT_TRUE(SDKShouldRetry(QS_ERR_SEND_REQUEST_ERROR, REQUEST_NOT_MADE));
  EXPECT_TRUE(
      SDKShouldRetry(QS_ERR_UNEXCEPTED_RESPONSE, SERVICE_UNAVAILABLE));
  EXPECT_TRUE(SDKShouldRetry(QS_ERR_UNEXCEPTED_RESPONSE, TOO_MANY_REQUESTS));
  EXPECT_FALSE(SDKShouldRetry(QS_ERR_UNEXCEPTED_RESPONSE, NOT_FOUND));
}

TEST(QSSDKErrorTest, ResponseCodeToString) {
  using namespace QingStor::Http;  // NOLINT
  EXPECT_EQ(string("NotFound(404)"), SDKResponseCodeToString(NOT_FOUND));
  EXPECT_EQ(string("PartialContent(206)"),
            SDKResponseCodeToString(PARTIAL_CONTENT));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
