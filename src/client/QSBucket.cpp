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

#include "client/QSBucket.h"

#include <stdint.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "qingstor/Bucket.h"
#include "qingstor/HttpCommon.h"
#include "qingstor/QsConfig.h"
#include "qingstor/QsErrors.h"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/Utils.h"
#include "client/QSSDKError.h"
#include "client/Utils.h"
#include "data/LocalFile.h"

namespace QSXfer {

namespace Client {

using boost::make_shared;
using boost::shared_ptr;
using QingStor::GetObjectInput;
using QingStor::GetObjectOutput;
using QingStor::HeadObjectInput;
using QingStor::HeadObjectOutput;
using QingStor::Http::HttpResponseCode;
using QingStor::PutObjectInput;
using QingStor::PutObjectOutput;
using QSXfer::Client::Utils::BuildRequestRange;
using QSXfer::Data::LocalFile;
using QSXfer::StringUtils::FormatPath;
using std::make_pair;
using std::pair;
using std::string;
using std::vector;

namespace {

static const char *const DEFAULT_CONTENT_TYPE = "application/octet-stream";

// --------------------------------------------------------------------------
ClientError<QSError::Value> FileIOError(const string &exceptionName,
                                        const string &msg) {
  return ClientError<QSError::Value>(QSError::FILE_IO_ERROR, exceptionName,
                                     msg, false);
}

// --------------------------------------------------------------------------
pair<bool, string> WriteLocalFile(const string &path,
                                  const vector<char> &data) {
  string dir = QSXfer::Utils::GetDirName(path);
  if (!QSXfer::Utils::CreateDirectoryIfNotExists(dir)) {
    return make_pair(false, "Unable to create directory " + FormatPath(dir));
  }

  LocalFile file(path);
  pair<bool, string> outcome = file.Open();
  if (!outcome.first) {
    return outcome;
  }
  if (!data.empty()) {
    outcome = file.WriteAt(&data[0], data.size(), 0);
    if (!outcome.first) {
      pair<bool, string> closed = file.Close();
      ErrorIf(!closed.first, closed.second);
      return outcome;
    }
  }
  return file.Close();
}

}  // namespace

// --------------------------------------------------------------------------
QSBucket::QSBucket(const QingStor::QsConfig &config, const string &bucketName,
                   const string &zone)
    : m_bucketName(bucketName),
      m_bucket(make_shared<QingStor::Bucket>(config, bucketName, zone)) {}

// --------------------------------------------------------------------------
UploadOutcome QSBucket::Upload(const string &filePath,
                               const UploadOptions &options) {
  string key = options.m_destination.empty()
                   ? QSXfer::Utils::GetBaseName(filePath)
                   : options.m_destination;
  string exceptionName = "QingStorPutObject object=" + key;
  if (!options.m_preconditions.IsEmpty()) {
    return UploadOutcome(ClientError<QSError::Value>(
        QSError::PRECONDITION_NOT_SUPPORTED, exceptionName,
        "QingStor has no object generation preconditions", false));
  }
  DebugWarningIf(!options.m_userMetaData.empty(),
                 "User metadata is not sent to QingStor " + FormatPath(key));

  pair<uint64_t, string> fileSize = QSXfer::Utils::GetFileSize(filePath);
  if (!fileSize.second.empty()) {
    return UploadOutcome(FileIOError(exceptionName, fileSize.second));
  }
  shared_ptr<std::fstream> body = make_shared<std::fstream>(
      filePath.c_str(), std::ios_base::in | std::ios_base::binary);
  if (!body->is_open()) {
    return UploadOutcome(
        FileIOError(exceptionName, "Unable to open " + FormatPath(filePath)));
  }

  PutObjectInput input;
  input.SetContentLength(fileSize.first);
  input.SetContentType(options.m_contentType.empty() ? DEFAULT_CONTENT_TYPE
                                                     : options.m_contentType);
  if (fileSize.first > 0) {
    input.SetBody(body.get());
  }

  PutObjectOutput output;
  QsError sdkErr = m_bucket->PutObject(key, input, output);
  HttpResponseCode responseCode = output.GetResponseCode();
  if (!SDKResponseSuccess(sdkErr, responseCode)) {
    return UploadOutcome(BuildQSError(sdkErr, exceptionName, output));
  }

  // PutObjectOutput carries no metadata, head the object again
  ObjectHandle handle(m_bucketName, key);
  GetMetadataOutcome meta = GetMetadata(handle);
  if (!meta.IsSuccess()) {
    return UploadOutcome(meta.GetError());
  }
  return UploadOutcome(make_pair(handle, meta.GetResult()));
}

// --------------------------------------------------------------------------
DownloadOutcome QSBucket::Download(const ObjectHandle &object,
                                   const DownloadOptions &options) {
  const string &key = object.GetObjectKey();
  string exceptionName = "QingStorGetObject object=" + key;

  GetObjectInput input;
  if (options.m_range) {
    input.SetRange(BuildRequestRange(options.m_range->m_start,
                                     options.m_range->m_end));
  }

  GetObjectOutput output;
  QsError sdkErr = m_bucket->GetObject(key, input, output);
  HttpResponseCode responseCode = output.GetResponseCode();
  if (!SDKResponseSuccess(sdkErr, responseCode)) {
    return DownloadOutcome(BuildQSError(sdkErr, exceptionName, output));
  }
  // a ranged request is answered with 206 (Partial Content)
  if (options.m_range && responseCode != QingStor::Http::PARTIAL_CONTENT) {
    Warning("Request for " << input.GetRange()
                           << ", but response is not 206 (Partial Content)");
    return DownloadOutcome(ClientError<QSError::Value>(
        QSError::SDK_UNEXPECTED_RESPONSE, exceptionName,
        SDKResponseCodeToString(responseCode), true));
  }

  Buffer content = make_shared<vector<char> >();
  std::iostream *bodyStream = output.GetBody();
  if (bodyStream != NULL) {
    bodyStream->seekg(0, std::ios_base::beg);
    content->assign(std::istreambuf_iterator<char>(*bodyStream),
                    std::istreambuf_iterator<char>());
  }

  if (!options.m_destination.empty()) {
    pair<bool, string> written =
        WriteLocalFile(options.m_destination, *content);
    if (!written.first) {
      return DownloadOutcome(FileIOError(exceptionName, written.second));
    }
  }
  return DownloadOutcome(content);
}

// --------------------------------------------------------------------------
GetMetadataOutcome QSBucket::GetMetadata(const ObjectHandle &object) {
  const string &key = object.GetObjectKey();
  string exceptionName = "QingStorHeadObject object=" + key;
  if (key.empty()) {
    return GetMetadataOutcome(ClientError<QSError::Value>(
        QSError::PARAMETER_MISSING, exceptionName, "Empty ObjectKey", false));
  }

  HeadObjectInput input;
  HeadObjectOutput output;
  QsError sdkErr = m_bucket->HeadObject(key, input, output);
  HttpResponseCode responseCode = output.GetResponseCode();
  if (!SDKResponseSuccess(sdkErr, responseCode)) {
    return GetMetadataOutcome(BuildQSError(sdkErr, exceptionName, output));
  }

  ObjectMetaData meta(key, static_cast<uint64_t>(output.GetContentLength()),
                      output.GetContentType(), output.GetETag(),
                      output.GetLastModified());
  return GetMetadataOutcome(meta);
}

}  // namespace Client
}  // namespace QSXfer
