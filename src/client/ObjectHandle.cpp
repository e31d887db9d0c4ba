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

#include "client/ObjectHandle.h"

#include <ostream>
#include <string>

#include "base/Utils.h"

namespace QSXfer {

namespace Client {

using std::ostream;
using std::string;

// --------------------------------------------------------------------------
bool ObjectHandle::operator==(const ObjectHandle &rhs) const {
  return m_bucketName == rhs.m_bucketName && m_objectKey == rhs.m_objectKey;
}

// --------------------------------------------------------------------------
string ObjectHandle::GetBaseName() const {
  return QSXfer::Utils::GetBaseName(m_objectKey);
}

// --------------------------------------------------------------------------
ostream &operator<<(ostream &os, const ObjectHandle &handle) {
  return os << "[bucket: " << handle.GetBucketName()
            << "] [object: " << handle.GetObjectKey() << "]";
}

}  // namespace Client
}  // namespace QSXfer
