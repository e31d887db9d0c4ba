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

#include "base/Utils.h"

#include <errno.h>
#include <stdint.h>
#include <stdlib.h>  // for free
#include <string.h>  // for strerror, strdup

#include <dirent.h>  // for opendir readdir
#include <libgen.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>  // for access

#include <string>
#include <utility>
#include <vector>

#include "boost/foreach.hpp"
#include "boost/scope_exit.hpp"

#include "base/StringUtils.h"

namespace QSXfer {

namespace Utils {

using QSXfer::StringUtils::FormatPath;
using std::make_pair;
using std::pair;
using std::string;
using std::vector;

static const char PATH_DELIM = '/';
static const mode_t DIR_MODE =
    (S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);

namespace {

string PostErrMsg(const string &path) {
  return string(": ") + strerror(errno) + " " + FormatPath(path);
}

}  // namespace

// --------------------------------------------------------------------------
bool CreateDirectoryIfNotExists(const string &path) {
  if (path.empty()) {
    return false;
  }
  if (IsRootDirectory(path)) {
    return true;
  }
  if (FileExists(path)) {
    return IsDirectory(path).first;
  }
  // create parent first
  if (!CreateDirectoryIfNotExists(GetDirName(path))) {
    return false;
  }
  return mkdir(path.c_str(), DIR_MODE) == 0 || errno == EEXIST;
}

// --------------------------------------------------------------------------
bool RemoveFileIfExists(const string &path) {
  int errorCode = unlink(path.c_str());
  return (errorCode == 0 || errno == ENOENT);
}

// --------------------------------------------------------------------------
pair<bool, string> DeleteFilesInDirectory(const string &path,
                                          bool deleteSelf) {
  bool success = true;
  string msg;

  DIR *dir = opendir(path.c_str());
  BOOST_SCOPE_EXIT((dir)) {
    if (dir) {
      closedir(dir);
      dir = NULL;
    }
  }
  BOOST_SCOPE_EXIT_END

  if (dir) {
    struct dirent *next = NULL;
    while ((next = readdir(dir)) != NULL) {
      if (strcmp(next->d_name, ".") == 0 || strcmp(next->d_name, "..") == 0) {
        continue;
      }

      string fullPath(path);
      if (fullPath[fullPath.size() - 1] != PATH_DELIM) {
        fullPath.append(1, PATH_DELIM);
      }
      fullPath.append(next->d_name);

      struct stat st;
      if (lstat(fullPath.c_str(), &st) != 0) {
        success = false;
        msg.assign("Could not get stats of file " + PostErrMsg(fullPath));
        break;
      }

      if (S_ISDIR(st.st_mode)) {
        pair<bool, string> sub = DeleteFilesInDirectory(fullPath, true);
        if (!sub.first) {
          success = false;
          msg.assign(sub.second);
          break;
        }
      } else if (unlink(fullPath.c_str()) != 0) {
        success = false;
        msg.assign("Could not remove file " + PostErrMsg(fullPath));
        break;
      }
    }
  } else {
    success = false;
    msg.assign("Could not open directory " + PostErrMsg(path));
  }

  if (success && deleteSelf && rmdir(path.c_str()) != 0) {
    success = false;
    msg.assign("Could not remove dir " + PostErrMsg(path));
  }

  return make_pair(success, msg);
}

// --------------------------------------------------------------------------
bool FileExists(const string &path) { return access(path.c_str(), F_OK) == 0; }

// --------------------------------------------------------------------------
pair<bool, string> IsDirectory(const string &path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    return make_pair(false, "Unable to access path " + PostErrMsg(path));
  }
  return make_pair(static_cast<bool>(S_ISDIR(st.st_mode)), string());
}

// --------------------------------------------------------------------------
pair<uint64_t, string> GetFileSize(const string &path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    return make_pair(0, "Unable to access file " + PostErrMsg(path));
  }
  if (!S_ISREG(st.st_mode)) {
    return make_pair(0, "Not a regular file " + FormatPath(path));
  }
  return make_pair(static_cast<uint64_t>(st.st_size), string());
}

// --------------------------------------------------------------------------
bool IsRootDirectory(const string &path) { return path == "/"; }

// --------------------------------------------------------------------------
string AppendPathDelim(const string &path) {
  string cpy(path);
  if (cpy.empty() || cpy[cpy.size() - 1] != PATH_DELIM) {
    cpy.append(1, PATH_DELIM);
  }
  return cpy;
}

// --------------------------------------------------------------------------
string GetPathDelimiter() { return string(1, PATH_DELIM); }

// --------------------------------------------------------------------------
string GetDirName(const string &path) {
  if (IsRootDirectory(path)) {
    return path;
  }

  char *cpy = strdup(path.c_str());
  string ret = AppendPathDelim(dirname(cpy));
  free(cpy);
  return ret;
}

// --------------------------------------------------------------------------
string GetBaseName(const string &path) {
  char *cpy = strdup(path.c_str());
  string ret(basename(cpy));
  free(cpy);
  return ret;
}

// --------------------------------------------------------------------------
string JoinPath(const string &left, const string &right) {
  string joined;
  if (left.empty()) {
    joined = right;
  } else if (right.empty()) {
    joined = left;
  } else {
    joined = left + PATH_DELIM + right;
  }
  if (joined.empty()) {
    return ".";
  }

  bool absolute = joined[0] == PATH_DELIM;
  bool trailingDelim = joined[joined.size() - 1] == PATH_DELIM;

  vector<string> components;
  string::size_type begin = 0;
  while (begin <= joined.size()) {
    string::size_type end = joined.find(PATH_DELIM, begin);
    if (end == string::npos) {
      end = joined.size();
    }
    string component = joined.substr(begin, end - begin);
    begin = end + 1;

    if (component.empty() || component == ".") {
      continue;
    }
    if (component == "..") {
      if (!components.empty() && components.back() != "..") {
        components.pop_back();
      } else if (!absolute) {
        components.push_back(component);
      }
      continue;
    }
    components.push_back(component);
  }

  string result = absolute ? GetPathDelimiter() : string();
  bool first = true;
  BOOST_FOREACH(const string &component, components) {
    if (!first) {
      result.append(1, PATH_DELIM);
    }
    result.append(component);
    first = false;
  }

  if (result.empty()) {
    return ".";
  }
  if (trailingDelim && !components.empty()) {
    result.append(1, PATH_DELIM);
  }
  return result;
}

}  // namespace Utils
}  // namespace QSXfer
