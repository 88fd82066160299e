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

#include "base/Utils.h"

#include <errno.h>
#include <stdint.h>
#include <stdlib.h>  // for free
#include <string.h>  // for strdup, strerror

#include <libgen.h>    // for dirname
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>  // for access

#include <string>
#include <utility>

#include "base/StringUtils.h"
#include "configure/Default.h"

namespace QSX {

namespace Utils {

using std::make_pair;
using std::pair;
using std::string;

static const char PATH_DELIM = '/';

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
  int errorCode =
      mkdir(path.c_str(), QSX::Configure::Default::GetDefineDirMode());
  return errorCode == 0 || errno == EEXIST;
}

// --------------------------------------------------------------------------
bool RemoveFileIfExists(const string &path) {
  int errorCode = unlink(path.c_str());
  return errorCode == 0 || errno == ENOENT;
}

// --------------------------------------------------------------------------
bool FileExists(const string &path) {
  return access(path.c_str(), F_OK) == 0;
}

// --------------------------------------------------------------------------
pair<bool, string> IsDirectory(const string &path) {
  struct stat stBuf;
  if (stat(path.c_str(), &stBuf) != 0) {
    return make_pair(false, string("Unable to access path : ") +
                                strerror(errno) + " " +
                                QSX::StringUtils::FormatPath(path));
  }
  return make_pair(static_cast<bool>(S_ISDIR(stBuf.st_mode)), string());
}

// --------------------------------------------------------------------------
bool IsWritableDirectory(const string &path) {
  return IsDirectory(path).first && access(path.c_str(), W_OK | X_OK) == 0;
}

// --------------------------------------------------------------------------
pair<bool, uint64_t> GetFileSize(const string &path) {
  struct stat stBuf;
  if (stat(path.c_str(), &stBuf) != 0) {
    return make_pair(false, static_cast<uint64_t>(0));
  }
  if (!S_ISREG(stBuf.st_mode)) {
    errno = EINVAL;
    return make_pair(false, static_cast<uint64_t>(0));
  }
  return make_pair(true, static_cast<uint64_t>(stBuf.st_size));
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
string GetDirName(const string &path) {
  if (IsRootDirectory(path)) {
    return path;
  }

  char *cpy = strdup(path.c_str());
  string ret = AppendPathDelim(dirname(cpy));
  free(cpy);
  return ret;
}

}  // namespace Utils
}  // namespace QSX
