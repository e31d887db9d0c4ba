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

#include "client/TransferManager.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <exception>
#include <new>
#include <string>
#include <utility>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/make_shared.hpp"
#include "boost/noncopyable.hpp"
#include "boost/optional.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/future.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "base/CancellationToken.h"
#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/ThreadPool.h"
#include "base/Utils.h"
#include "client/Bucket.h"
#include "client/Utils.h"
#include "configure/Default.h"
#include "data/LocalFile.h"

namespace QSXfer {

namespace Client {

using boost::lock_guard;
using boost::to_string;
using boost::make_shared;
using boost::mutex;
using boost::shared_ptr;
using boost::unique_future;
using QSXfer::Client::Utils::ChunkPlan;
using QSXfer::Client::Utils::PlanChunks;
using QSXfer::Configure::Default::GetDefaultParallelDownloadLimit;
using QSXfer::Configure::Default::GetDefaultParallelUploadLimit;
using QSXfer::Data::LocalFile;
using QSXfer::Exception::QSXferException;
using QSXfer::StringUtils::FormatPath;
using QSXfer::Threading::CancellationToken;
using QSXfer::Threading::ThreadPool;
using QSXfer::Utils::JoinPath;
using std::pair;
using std::string;
using std::vector;

namespace {

//
// State shared by all tasks of one operation
//
class TransferContext : private boost::noncopyable {
 public:
  explicit TransferContext(const shared_ptr<CancellationToken> &token)
      : m_cancellationToken(token) {}

 public:
  bool IsCancelled() const {
    return m_cancellationToken && m_cancellationToken->IsCancelled();
  }

  // Keep the first error reported, in completion order
  void RecordError(const ClientError<QSError::Value> &err) {
    lock_guard<mutex> lock(m_errorLock);
    if (!m_firstError) {
      m_firstError = err;
    }
  }

  boost::optional<ClientError<QSError::Value> > GetFirstError() const {
    lock_guard<mutex> lock(m_errorLock);
    return m_firstError;
  }

 private:
  shared_ptr<CancellationToken> m_cancellationToken;
  boost::optional<ClientError<QSError::Value> > m_firstError;
  mutable mutex m_errorLock;
};

// --------------------------------------------------------------------------
size_t GetPoolSize(size_t concurrencyLimit, size_t defaultLimit,
                   size_t itemCount) {
  size_t limit = concurrencyLimit > 0 ? concurrencyLimit : defaultLimit;
  return std::min(limit, std::max(itemCount, static_cast<size_t>(1)));
}

// --------------------------------------------------------------------------
ClientError<QSError::Value> BuildError(QSError::Value err,
                                       const string &operation,
                                       const string &msg) {
  return ClientError<QSError::Value>(err, operation, msg, false);
}

// --------------------------------------------------------------------------
UploadOutcome UploadOne(const shared_ptr<Bucket> &bucket,
                        const string &filePath, const UploadOptions &options,
                        const shared_ptr<TransferContext> &context) {
  if (context->IsCancelled()) {
    ClientError<QSError::Value> err = BuildError(
        QSError::CANCELLED, "UploadMulti",
        "Cancelled before upload " + FormatPath(filePath));
    context->RecordError(err);
    return UploadOutcome(err);
  }

  DebugInfo("Uploading file " << FormatPath(filePath, options.m_destination));
  UploadOutcome outcome;
  try {
    outcome = bucket->Upload(filePath, options);
  } catch (const std::exception &ex) {
    outcome = UploadOutcome(
        BuildError(QSError::UNKNOWN, "UploadMulti",
                   string(ex.what()) + " " + FormatPath(filePath)));
  } catch (...) {
    outcome = UploadOutcome(
        BuildError(QSError::UNKNOWN, "UploadMulti",
                   "Unknown exception " + FormatPath(filePath)));
  }

  if (!outcome.IsSuccess()) {
    Error("Fail to upload file " << FormatPath(filePath) << " : "
                                 << GetMessageForQSError(outcome.GetError()));
    context->RecordError(outcome.GetError());
  }
  return outcome;
}

// --------------------------------------------------------------------------
DownloadOutcome DownloadOne(const shared_ptr<Bucket> &bucket,
                            const ObjectHandle &object,
                            const DownloadOptions &options,
                            const shared_ptr<TransferContext> &context) {
  if (context->IsCancelled()) {
    ClientError<QSError::Value> err =
        BuildError(QSError::CANCELLED, "DownloadMulti",
                   "Cancelled before download " + object.GetObjectKey());
    context->RecordError(err);
    return DownloadOutcome(err);
  }

  DebugInfo("Downloading object "
            << FormatPath(object.GetObjectKey(), options.m_destination));
  DownloadOutcome outcome;
  try {
    outcome = bucket->Download(object, options);
  } catch (const std::exception &ex) {
    outcome = DownloadOutcome(
        BuildError(QSError::UNKNOWN, "DownloadMulti",
                   string(ex.what()) + " " +
                       FormatPath(object.GetObjectKey())));
  } catch (...) {
    outcome = DownloadOutcome(
        BuildError(QSError::UNKNOWN, "DownloadMulti",
                   "Unknown exception " + FormatPath(object.GetObjectKey())));
  }

  if (!outcome.IsSuccess()) {
    Error("Fail to download object "
          << FormatPath(object.GetObjectKey()) << " : "
          << GetMessageForQSError(outcome.GetError()));
    context->RecordError(outcome.GetError());
  }
  return outcome;
}

// --------------------------------------------------------------------------
ClientError<QSError::Value> GoodError(const string &operation) {
  return ClientError<QSError::Value>(QSError::GOOD, operation, string(), false);
}

// --------------------------------------------------------------------------
// Fetch one range, write it to the local file and copy it into content at
// the range offset. The chunk buffer is released when the task returns.
ClientError<QSError::Value> DownloadChunk(
    const shared_ptr<Bucket> &bucket, const ObjectHandle &object,
    const ByteRange &range, const shared_ptr<LocalFile> &file,
    const Buffer &content, const shared_ptr<TransferContext> &context) {
  string rangeStr = QSXfer::Client::Utils::BuildRequestRange(range.m_start,
                                                             range.m_end);
  if (context->IsCancelled()) {
    ClientError<QSError::Value> err =
        BuildError(QSError::CANCELLED, "DownloadLargeFile",
                   "Cancelled before download " + rangeStr);
    context->RecordError(err);
    return err;
  }

  DebugInfo("Downloading chunk " << rangeStr << " of "
                                 << FormatPath(object.GetObjectKey()));
  DownloadOptions options;
  options.m_range = range;

  DownloadOutcome outcome;
  try {
    outcome = bucket->Download(object, options);
  } catch (const std::exception &ex) {
    outcome = DownloadOutcome(BuildError(QSError::UNKNOWN, "DownloadLargeFile",
                                         ex.what() + string(" ") + rangeStr));
  } catch (...) {
    outcome = DownloadOutcome(BuildError(QSError::UNKNOWN, "DownloadLargeFile",
                                         "Unknown exception " + rangeStr));
  }

  if (outcome.IsSuccess()) {
    const Buffer &chunk = outcome.GetResult();
    if (!chunk || chunk->size() != range.GetSize()) {
      outcome = DownloadOutcome(
          BuildError(QSError::SDK_UNEXPECTED_RESPONSE, "DownloadLargeFile",
                     "Unexpected content length for " + rangeStr));
    } else {
      pair<bool, string> written =
          file->WriteAt(chunk->empty() ? NULL : &(*chunk)[0], chunk->size(),
                        range.m_start);
      if (!written.first) {
        outcome = DownloadOutcome(BuildError(
            QSError::FILE_IO_ERROR, "DownloadLargeFile", written.second));
      } else {
        // ranges are disjoint, tasks never touch the same bytes
        std::copy(chunk->begin(), chunk->end(),
                  content->begin() + static_cast<ptrdiff_t>(range.m_start));
      }
    }
  }

  if (!outcome.IsSuccess()) {
    Error("Fail to download chunk "
          << rangeStr << " of " << FormatPath(object.GetObjectKey()) << " : "
          << GetMessageForQSError(outcome.GetError()));
    context->RecordError(outcome.GetError());
    return outcome.GetError();
  }
  return GoodError("DownloadLargeFile");
}

// --------------------------------------------------------------------------
// Return null with err set if the workers could not be started
shared_ptr<ThreadPool> StartPool(size_t poolSize, const string &operation,
                                 ClientError<QSError::Value> *err) {
  try {
    return make_shared<ThreadPool>(poolSize);
  } catch (const std::exception &ex) {
    *err = BuildError(QSError::UNKNOWN, operation,
                      "Unable to start " + to_string(poolSize) +
                          " workers : " + ex.what());
    Error(GetMessageForQSError(*err));
    return shared_ptr<ThreadPool>();
  }
}

}  // namespace

// --------------------------------------------------------------------------
TransferManager::TransferManager(const shared_ptr<Bucket> &bucket)
    : m_bucket(bucket) {
  if (!m_bucket) {
    throw QSXferException("TransferManager requires a bucket");
  }
}

// --------------------------------------------------------------------------
UploadMultiOutcome TransferManager::UploadMulti(
    const vector<string> &filePaths, const UploadMultiOptions &options) const {
  size_t poolSize =
      GetPoolSize(options.m_concurrencyLimit, GetDefaultParallelUploadLimit(),
                  filePaths.size());
  Info("Start uploading " << filePaths.size() << " files to bucket "
                          << m_bucket->GetName() << " [concurrency="
                          << poolSize << "]");

  shared_ptr<TransferContext> context =
      make_shared<TransferContext>(options.m_cancellationToken);
  vector<UploadResponse> responses;
  responses.reserve(filePaths.size());
  {
    vector<unique_future<UploadOutcome> > futures;
    futures.reserve(filePaths.size());
    ClientError<QSError::Value> poolError;
    shared_ptr<ThreadPool> pool =
        StartPool(poolSize, "UploadMulti", &poolError);
    if (!pool) {
      return UploadMultiOutcome(poolError);
    }
    BOOST_FOREACH(const string &filePath, filePaths) {
      UploadOptions uploadOptions = BuildUploadOptions(filePath, options);
      futures.push_back(pool->SubmitCallable(&UploadOne, m_bucket, filePath,
                                             uploadOptions, context));
    }

    // wait for all in submission order
    for (size_t i = 0; i < futures.size(); ++i) {
      UploadOutcome outcome = futures[i].get();
      if (outcome.IsSuccess()) {
        responses.push_back(outcome.GetResult());
      }
    }
  }

  boost::optional<ClientError<QSError::Value> > err = context->GetFirstError();
  if (err) {
    return UploadMultiOutcome(*err);
  }
  return UploadMultiOutcome(responses);
}

// --------------------------------------------------------------------------
void TransferManager::UploadMulti(const vector<string> &filePaths,
                                  const UploadMultiOptions &options,
                                  const UploadMultiCallback &callback) const {
  UploadMultiOutcome outcome = UploadMulti(filePaths, options);
  if (!callback) {
    DebugWarning("No callback to receive upload outcome");
    return;
  }

  vector<ObjectHandle> handles;
  vector<ObjectMetaData> metas;
  if (!outcome.IsSuccess()) {
    callback(outcome.GetError(), handles, metas);
    return;
  }
  BOOST_FOREACH(const UploadResponse &response, outcome.GetResult()) {
    handles.push_back(response.first);
    metas.push_back(response.second);
  }
  callback(GoodError("UploadMulti"), handles, metas);
}

// --------------------------------------------------------------------------
DownloadMultiOutcome TransferManager::DownloadMulti(
    const vector<ObjectHandle> &objects,
    const DownloadMultiOptions &options) const {
  size_t poolSize =
      GetPoolSize(options.m_concurrencyLimit, GetDefaultParallelDownloadLimit(),
                  objects.size());
  Info("Start downloading " << objects.size() << " objects from bucket "
                            << m_bucket->GetName() << " [concurrency="
                            << poolSize << "]");

  shared_ptr<TransferContext> context =
      make_shared<TransferContext>(options.m_cancellationToken);
  vector<Buffer> contents;
  contents.reserve(objects.size());
  {
    vector<unique_future<DownloadOutcome> > futures;
    futures.reserve(objects.size());
    ClientError<QSError::Value> poolError;
    shared_ptr<ThreadPool> pool =
        StartPool(poolSize, "DownloadMulti", &poolError);
    if (!pool) {
      return DownloadMultiOutcome(poolError);
    }
    BOOST_FOREACH(const ObjectHandle &object, objects) {
      DownloadOptions downloadOptions = BuildDownloadOptions(object, options);
      futures.push_back(pool->SubmitCallable(&DownloadOne, m_bucket, object,
                                             downloadOptions, context));
    }

    for (size_t i = 0; i < futures.size(); ++i) {
      DownloadOutcome outcome = futures[i].get();
      if (outcome.IsSuccess()) {
        contents.push_back(outcome.GetResult());
      }
    }
  }

  boost::optional<ClientError<QSError::Value> > err = context->GetFirstError();
  if (err) {
    return DownloadMultiOutcome(*err);
  }
  return DownloadMultiOutcome(contents);
}

// --------------------------------------------------------------------------
void TransferManager::DownloadMulti(
    const vector<ObjectHandle> &objects, const DownloadMultiOptions &options,
    const DownloadMultiCallback &callback) const {
  DownloadMultiOutcome outcome = DownloadMulti(objects, options);
  if (!callback) {
    DebugWarning("No callback to receive download outcome");
    return;
  }

  if (outcome.IsSuccess()) {
    callback(GoodError("DownloadMulti"), outcome.GetResult());
  } else {
    callback(outcome.GetError(), vector<Buffer>());
  }
}

// --------------------------------------------------------------------------
DownloadOutcome TransferManager::DownloadLargeFile(
    const ObjectHandle &object, const LargeFileDownloadOptions &options) const {
  shared_ptr<TransferContext> context =
      make_shared<TransferContext>(options.m_cancellationToken);
  if (context->IsCancelled()) {
    return DownloadOutcome(
        BuildError(QSError::CANCELLED, "DownloadLargeFile",
                   "Cancelled before download " + object.GetObjectKey()));
  }

  // Size decides the chunking, nothing proceeds without it
  GetMetadataOutcome metaOutcome;
  try {
    metaOutcome = m_bucket->GetMetadata(object);
  } catch (const std::exception &ex) {
    metaOutcome = GetMetadataOutcome(
        BuildError(QSError::UNKNOWN, "DownloadLargeFile",
                   string(ex.what()) + " " +
                       FormatPath(object.GetObjectKey())));
  }
  if (!metaOutcome.IsSuccess()) {
    Error("Fail to get metadata of object "
          << FormatPath(object.GetObjectKey()) << " : "
          << GetMessageForQSError(metaOutcome.GetError()));
    return DownloadOutcome(metaOutcome.GetError());
  }

  uint64_t size = metaOutcome.GetResult().GetContentLength();
  Buffer content = make_shared<vector<char> >();
  if (size > static_cast<uint64_t>(content->max_size())) {
    ClientError<QSError::Value> err =
        BuildError(QSError::PARAMETER_INVALID, "DownloadLargeFile",
                   "Object too large to hold in memory [size=" +
                       to_string(size) + "] " +
                       FormatPath(object.GetObjectKey()));
    Error(GetMessageForQSError(err));
    return DownloadOutcome(err);
  }
  try {
    content->resize(static_cast<size_t>(size));
  } catch (const std::bad_alloc &) {
    ClientError<QSError::Value> err =
        BuildError(QSError::PARAMETER_INVALID, "DownloadLargeFile",
                   "Unable to allocate " + to_string(size) + " bytes for " +
                       FormatPath(object.GetObjectKey()));
    Error(GetMessageForQSError(err));
    return DownloadOutcome(err);
  }

  ChunkPlan plan =
      PlanChunks(size, options.m_chunkSize, options.m_concurrencyLimit);
  string filePath =
      JoinPath(options.m_destinationDirectory, object.GetBaseName());
  Info("Start downloading object "
       << FormatPath(object.GetObjectKey(), filePath) << " [size=" << size
       << "] [chunks=" << plan.m_ranges.size()
       << "] [concurrency=" << plan.m_concurrency << "]");

  // Shared by every chunk task. Whichever path leaves this function, the
  // last owner going away closes the file if Close below was not reached.
  shared_ptr<LocalFile> file = make_shared<LocalFile>(filePath);
  {
    vector<unique_future<ClientError<QSError::Value> > > futures;
    futures.reserve(plan.m_ranges.size());
    ClientError<QSError::Value> poolError;
    shared_ptr<ThreadPool> pool =
        StartPool(plan.m_concurrency, "DownloadLargeFile", &poolError);
    if (!pool) {
      return DownloadOutcome(poolError);
    }

    pair<bool, string> opened = file->Open();
    if (!opened.first) {
      Error(opened.second);
      return DownloadOutcome(BuildError(QSError::FILE_IO_ERROR,
                                        "DownloadLargeFile", opened.second));
    }
    BOOST_FOREACH(const ByteRange &range, plan.m_ranges) {
      futures.push_back(pool->SubmitCallable(&DownloadChunk, m_bucket, object,
                                             range, file, content, context));
    }

    // outcomes are already recorded in context
    for (size_t i = 0; i < futures.size(); ++i) {
      futures[i].get();
    }
  }

  // all writes have settled
  pair<bool, string> closed = file->Close();
  boost::optional<ClientError<QSError::Value> > err = context->GetFirstError();
  if (err) {
    ErrorIf(!closed.first, closed.second);
    return DownloadOutcome(*err);
  }
  if (!closed.first) {
    Error(closed.second);
    return DownloadOutcome(
        BuildError(QSError::FILE_IO_ERROR, "DownloadLargeFile", closed.second));
  }

  Info("Finish downloading object "
       << FormatPath(object.GetObjectKey(), filePath));
  return DownloadOutcome(content);
}

// --------------------------------------------------------------------------
void TransferManager::DownloadLargeFile(
    const ObjectHandle &object, const LargeFileDownloadOptions &options,
    const DownloadCallback &callback) const {
  DownloadOutcome outcome = DownloadLargeFile(object, options);
  if (!callback) {
    DebugWarning("No callback to receive download outcome");
    return;
  }

  if (outcome.IsSuccess()) {
    callback(GoodError("DownloadLargeFile"), outcome.GetResult());
  } else {
    callback(outcome.GetError(), make_shared<vector<char> >());
  }
}

}  // namespace Client
}  // namespace QSXfer
