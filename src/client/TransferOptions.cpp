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

#include "client/TransferOptions.h"

#include <string>

#include "base/StringUtils.h"
#include "base/Utils.h"

namespace QSXfer {

namespace Client {

using QSXfer::StringUtils::RemovePrefix;
using QSXfer::Utils::GetBaseName;
using QSXfer::Utils::JoinPath;
using std::string;

// --------------------------------------------------------------------------
UploadOptions BuildUploadOptions(const string &filePath,
                                 const UploadMultiOptions &options) {
  UploadOptions uploadOptions = options.m_passthroughOptions
                                    ? *options.m_passthroughOptions
                                    : UploadOptions();
  if (options.m_skipIfExists) {
    uploadOptions.m_preconditions.m_ifGenerationMatch = 0;
  }
  if (!options.m_prefix.empty()) {
    uploadOptions.m_destination =
        JoinPath(options.m_prefix, GetBaseName(filePath));
  }
  return uploadOptions;
}

// --------------------------------------------------------------------------
DownloadOptions BuildDownloadOptions(const ObjectHandle &object,
                                     const DownloadMultiOptions &options) {
  DownloadOptions downloadOptions = options.m_passthroughOptions
                                        ? *options.m_passthroughOptions
                                        : DownloadOptions();
  if (!options.m_prefix.empty()) {
    downloadOptions.m_destination =
        JoinPath(JoinPath(options.m_prefix, downloadOptions.m_destination),
                 object.GetObjectKey());
  }
  if (!options.m_stripPrefix.empty()) {
    downloadOptions.m_destination =
        RemovePrefix(object.GetObjectKey(), options.m_stripPrefix);
  }
  return downloadOptions;
}

}  // namespace Client
}  // namespace QSXfer
