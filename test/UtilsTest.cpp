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

#include <stdint.h>
#include <stdio.h>

#include <string>
#include <utility>

#include "gtest/gtest.h"

#include "base/Utils.h"

namespace {

using QSXfer::Utils::AppendPathDelim;
using QSXfer::Utils::CreateDirectoryIfNotExists;
using QSXfer::Utils::DeleteFilesInDirectory;
using QSXfer::Utils::FileExists;
using QSXfer::Utils::GetBaseName;
using QSXfer::Utils::GetDirName;
using QSXfer::Utils::GetFileSize;
using QSXfer::Utils::IsDirectory;
using QSXfer::Utils::JoinPath;
using QSXfer::Utils::RemoveFileIfExists;
using std::pair;
using std::string;

static const char *const testDir = "/tmp/qsxfer.test.utils/";

void WriteFile(const string &path, const string &content) {
  FILE *pf = fopen(path.c_str(), "w");
  ASSERT_TRUE(pf != NULL) << "Fail to open " << path;
  fwrite(content.data(), 1, content.size(), pf);
  fclose(pf);
}

}  // namespace

TEST(UtilsTest, JoinPath) {
  EXPECT_EQ(string("out/x/a.txt"), JoinPath("out", "x/a.txt"));
  EXPECT_EQ(string("out/x/a.txt"), JoinPath("out/", "x/a.txt"));
  EXPECT_EQ(string("out/x/a.txt"), JoinPath("out//", "/x/a.txt"));
  EXPECT_EQ(string("/data/a.bin"), JoinPath("/data", "a.bin"));
  EXPECT_EQ(string("a.txt"), JoinPath("", "a.txt"));
  EXPECT_EQ(string("out"), JoinPath("out", ""));
  EXPECT_EQ(string("."), JoinPath("", ""));
  EXPECT_EQ(string("out/b"), JoinPath("out/./a", "../b"));
  EXPECT_EQ(string("../b"), JoinPath("..", "b"));
  EXPECT_EQ(string("/b"), JoinPath("/..", "b"));
  EXPECT_EQ(string("out/dir/"), JoinPath("out", "dir/"));
  EXPECT_EQ(string("/"), JoinPath("/", ""));
}

TEST(UtilsTest, PathComponents) {
  EXPECT_EQ(string("c.txt"), GetBaseName("a/b/c.txt"));
  EXPECT_EQ(string("b"), GetBaseName("a/b/"));
  EXPECT_EQ(string("c.txt"), GetBaseName("c.txt"));
  EXPECT_EQ(string("/a/b/"), GetDirName("/a/b/c.txt"));
  EXPECT_EQ(string("./"), GetDirName("c.txt"));
  EXPECT_EQ(string("/"), GetDirName("/"));
  EXPECT_EQ(string("a/"), AppendPathDelim("a"));
  EXPECT_EQ(string("a/"), AppendPathDelim("a/"));
}

TEST(UtilsTest, DirectoryAndFiles) {
  string nested = string(testDir) + "x/y/z";
  ASSERT_TRUE(CreateDirectoryIfNotExists(nested));
  EXPECT_TRUE(IsDirectory(nested).first);
  EXPECT_TRUE(CreateDirectoryIfNotExists(nested));  // already there

  string file = nested + "/f.txt";
  WriteFile(file, "12345");
  EXPECT_TRUE(FileExists(file));
  EXPECT_FALSE(IsDirectory(file).first);
  EXPECT_TRUE(IsDirectory(file).second.empty());

  pair<uint64_t, string> size = GetFileSize(file);
  EXPECT_EQ(5u, size.first);
  EXPECT_TRUE(size.second.empty());

  // a regular file in the way
  EXPECT_FALSE(CreateDirectoryIfNotExists(file + "/sub"));

  EXPECT_TRUE(RemoveFileIfExists(file));
  EXPECT_FALSE(FileExists(file));
  EXPECT_TRUE(RemoveFileIfExists(file));

  pair<bool, string> deleted = DeleteFilesInDirectory(testDir, true);
  EXPECT_TRUE(deleted.first) << deleted.second;
  EXPECT_FALSE(FileExists(testDir));
}

TEST(UtilsTest, GetFileSizeFailure) {
  pair<uint64_t, string> missing = GetFileSize("/tmp/qsxfer.no.such.file");
  EXPECT_EQ(0u, missing.first);
  EXPECT_FALSE(missing.second.empty());

  pair<uint64_t, string> dir = GetFileSize("/tmp");
  EXPECT_EQ(0u, dir.first);
  EXPECT_FALSE(dir.second.empty());
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
