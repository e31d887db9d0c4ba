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

#include "client/QSError.h"

namespace {

using QSXfer::Client::ClientError;
using QSXfer::Client::GetMessageForQSError;
using QSXfer::Client::IsGoodQSError;
using QSXfer::Client::QSError;
using QSXfer::Client::QSErrorToString;
using QSXfer::Client::StringToQSError;
using std::string;

}  // namespace

TEST(QSErrorTest, ErrorToString) {
  EXPECT_EQ(string("Good"), QSErrorToString(QSError::GOOD));
  EXPECT_EQ(string("Cancelled"), QSErrorToString(QSError::CANCELLED));
  EXPECT_EQ(string("FileIOError"), QSErrorToString(QSError::FILE_IO_ERROR));
  EXPECT_EQ(string("PreconditionFailed"),
            QSErrorToString(QSError::PRECONDITION_FAILED));
  EXPECT_EQ(string("SDKSignWithInvalidKey"),
            QSErrorToString(QSError::SDK_SIGN_WITH_INVAILD_KEY));
  EXPECT_EQ(string("Unknow"), QSErrorToString(QSError::UNKNOWN));
}

TEST(QSErrorTest, StringToError) {
  EXPECT_EQ(QSError::NOT_FOUND, StringToQSError("NotFound"));
  EXPECT_EQ(QSError::PRECONDITION_NOT_SUPPORTED,
            StringToQSError("PreconditionNotSupported"));
  EXPECT_EQ(QSError::UNKNOWN, StringToQSError("NoSuchError"));
  EXPECT_EQ(QSError::UNKNOWN, StringToQSError(""));
  EXPECT_EQ(QSError::SDK_REQUEST_SEND_ERROR,
            StringToQSError("SDKRequestSendError"));
}

TEST(QSErrorTest, Message) {
  ClientError<QSError::Value> err(QSError::PRECONDITION_FAILED, "UploadMulti",
                                  "generation mismatch", false);
  EXPECT_EQ(string("PreconditionFailed, UploadMulti:generation mismatch"),
            GetMessageForQSError(err));
  EXPECT_FALSE(IsGoodQSError(err));
  EXPECT_FALSE(err.ShouldRetry());

  ClientError<QSError::Value> good(QSError::GOOD, false);
  EXPECT_TRUE(IsGoodQSError(good));

  // value initialized
  ClientError<QSError::Value> empty;
  EXPECT_EQ(QSError::UNKNOWN, empty.GetError());
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
