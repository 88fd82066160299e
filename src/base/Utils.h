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

#ifndef QSXFER_BASE_UTILS_H_
#define QSXFER_BASE_UTILS_H_

#include <stdint.h>

#include <string>
#include <utility>

namespace QSX {

namespace Utils {

// Create directory recursively if it doesn't exists
//
// @param  : dir path
// @return : bool
bool CreateDirectoryIfNotExists(const std::string &path);

// Remove file if it exists
//
// @param  : file path
// @return : bool
bool RemoveFileIfExists(const std::string &path);

// Check if file exists
bool FileExists(const std::string &path);

// Check if file is a directory
std::pair<bool, std::string> IsDirectory(const std::string &path);

// Check if the calling process can create files under dir
bool IsWritableDirectory(const std::string &path);

// Get size of a regular file
//
// @param  : file path
// @return : a pair of {true, size} or {false, 0}, errno is kept on failure
std::pair<bool, uint64_t> GetFileSize(const std::string &path);

// Check if path is root
bool IsRootDirectory(const std::string &path);

// Append delim to path
//
// @param  : file path
// @return : path appended
std::string AppendPathDelim(const std::string &path);

// Get dir name where the file belongs to
//
// @param  : file path
// @return : dir name ending with "/"
std::string GetDirName(const std::string &path);

}  // namespace Utils
}  // namespace QSX

#endif  // QSXFER_BASE_UTILS_H_
