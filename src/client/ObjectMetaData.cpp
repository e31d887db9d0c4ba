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

#include "client/ObjectMetaData.h"

#include <ostream>

#include "boost/exception/to_string.hpp"

namespace QSXfer {

namespace Client {

using boost::to_string;
using std::ostream;

// --------------------------------------------------------------------------
bool ObjectMetaData::operator==(const ObjectMetaData &rhs) const {
  return m_objectKey == rhs.m_objectKey &&
         m_contentLength == rhs.m_contentLength &&
         m_generation == rhs.m_generation &&
         m_contentType == rhs.m_contentType && m_eTag == rhs.m_eTag &&
         m_lastModified == rhs.m_lastModified;
}

// --------------------------------------------------------------------------
ostream &operator<<(ostream &os, const ObjectMetaData &meta) {
  os << "[key: " << meta.GetObjectKey() << "] "
     << "[size: " << to_string(meta.GetContentLength()) << "] ";
  if (meta.GetGeneration()) {
    os << "[generation: " << to_string(*meta.GetGeneration()) << "] ";
  }
  return os << "[type: " << meta.GetContentType() << "] "
            << "[etag: " << meta.GetETag() << "] "
            << "[mtime: " << meta.GetLastModified() << "]";
}

}  // namespace Client
}  // namespace QSXfer
