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

#ifndef QSXFER_CLIENT_OBJECTHANDLE_H_
#define QSXFER_CLIENT_OBJECTHANDLE_H_

#include <ostream>
#include <string>

namespace QSXfer {

namespace Client {

/**
 * Reference to one remote object
 */
class ObjectHandle {
 public:
  ObjectHandle() {}
  ObjectHandle(const std::string &bucketName, const std::string &objectKey)
      : m_bucketName(bucketName), m_objectKey(objectKey) {}

  bool operator==(const ObjectHandle &rhs) const;
  bool operator!=(const ObjectHandle &rhs) const { return !(*this == rhs); }

 public:
  const std::string &GetBucketName() const { return m_bucketName; }
  const std::string &GetObjectKey() const { return m_objectKey; }

  // Return last path component of object key, "x/report.csv" -> "report.csv"
  std::string GetBaseName() const;

 private:
  std::string m_bucketName;
  std::string m_objectKey;
};

std::ostream &operator<<(std::ostream &os, const ObjectHandle &handle);

}  // namespace Client
}  // namespace QSXfer

#endif  // QSXFER_CLIENT_OBJECTHANDLE_H_
