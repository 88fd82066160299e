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

#ifndef QSXFER_BASE_STRINGUTILS_H_
#define QSXFER_BASE_STRINGUTILS_H_

#include <stdint.h>

#include <string>

namespace QSX {

namespace StringUtils {

std::string ToLower(const std::string &str);
std::string ToUpper(const std::string &str);

std::string LTrim(const std::string &str, unsigned char c);
std::string RTrim(const std::string &str, unsigned char c);
std::string Trim(const std::string &str, unsigned char c);

// Check if str ends with the given suffix
bool EndsWith(const std::string &str, const std::string &suffix);

// Format an http byte range header value
//
// @param  : offset, length (must be > 0)
// @return : "bytes=<offset>-<offset+length-1>"
std::string FormatByteRange(uint64_t offset, uint64_t length);

// Format path
//
// @param  : path
// @return : formatted string
std::string FormatPath(const std::string &path);

// Format object location
//
// @param  : bucket, key
// @return : "[bucket=... key=...]"
std::string FormatObject(const std::string &bucket, const std::string &key);

}  // namespace StringUtils
}  // namespace QSX

#endif  // QSXFER_BASE_STRINGUTILS_H_
