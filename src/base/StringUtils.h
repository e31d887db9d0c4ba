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

#ifndef QSXFER_BASE_STRINGUTILS_H_
#define QSXFER_BASE_STRINGUTILS_H_

#include <string>

namespace QSXfer {

namespace StringUtils {

std::string ToLower(const std::string &str);

std::string LTrim(const std::string &str, unsigned char c);
std::string RTrim(const std::string &str, unsigned char c);
std::string Trim(const std::string &str, unsigned char c);

// Remove a leading literal prefix
//
// @param  : string, prefix
// @return : string without the prefix
//
// The match is anchored at the start and is purely textual, so "x/" is
// stripped from "x/a" but "x" is stripped from "xy/a" as well. If str does
// not start with prefix (or prefix is empty), str is returned unchanged.
std::string RemovePrefix(const std::string &str, const std::string &prefix);

// Format path for log message
//
// @param  : path
// @return : string in form of "[path=...]"
std::string FormatPath(const std::string &path);
std::string FormatPath(const std::string &from, const std::string &to);

}  // namespace StringUtils
}  // namespace QSXfer

#endif  // QSXFER_BASE_STRINGUTILS_H_
