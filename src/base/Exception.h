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

#ifndef QSXFER_BASE_EXCEPTION_H_
#define QSXFER_BASE_EXCEPTION_H_

#include <stdexcept>
#include <string>

namespace QSX {

namespace Exception {

// Raised for unrecoverable setup problems such as a malformed command line,
// an invalid object uri or an unusable log directory. Transfer failures are
// reported through error values instead.
struct QSXException : public std::runtime_error {
  explicit QSXException(const std::string& msg) : std::runtime_error(msg) {}
  explicit QSXException(const char* msg)
      : std::runtime_error(std::string(msg)) {}

  std::string get() const { return this->what(); }
};

}  // namespace Exception
}  // namespace QSX

#endif  // QSXFER_BASE_EXCEPTION_H_
