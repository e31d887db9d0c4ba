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

#ifndef QSXFER_CLIENT_OBJECTMETADATA_H_
#define QSXFER_CLIENT_OBJECTMETADATA_H_

#include <stdint.h>

#include <map>
#include <ostream>
#include <string>

#include "boost/optional.hpp"

namespace QSXfer {

namespace Client {

typedef std::map<std::string, std::string> UserMetaData;

/**
 * Object metadata reported by the store
 */
class ObjectMetaData {
 public:
  ObjectMetaData() : m_contentLength(0) {}
  ObjectMetaData(const std::string &objectKey, uint64_t contentLength,
                 const std::string &contentType = std::string(),
                 const std::string &eTag = std::string(),
                 const std::string &lastModified = std::string())
      : m_objectKey(objectKey),
        m_contentLength(contentLength),
        m_contentType(contentType),
        m_eTag(eTag),
        m_lastModified(lastModified) {}

  bool operator==(const ObjectMetaData &rhs) const;

 public:
  // accessor
  const std::string &GetObjectKey() const { return m_objectKey; }
  uint64_t GetContentLength() const { return m_contentLength; }
  // Stores without object generations leave it unset
  const boost::optional<int64_t> &GetGeneration() const {
    return m_generation;
  }
  const std::string &GetContentType() const { return m_contentType; }
  const std::string &GetETag() const { return m_eTag; }
  const std::string &GetLastModified() const { return m_lastModified; }

  // mutator
  void SetGeneration(int64_t generation) { m_generation = generation; }

 private:
  std::string m_objectKey;
  uint64_t m_contentLength;
  boost::optional<int64_t> m_generation;
  std::string m_contentType;
  std::string m_eTag;
  std::string m_lastModified;  // as reported by the store
};

std::ostream &operator<<(std::ostream &os, const ObjectMetaData &meta);

}  // namespace Client
}  // namespace QSXfer

#endif  // QSXFER_CLIENT_OBJECTMETADATA_H_
