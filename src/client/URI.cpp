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

#include "client/URI.h"

#include <ctype.h>

#include <string>

#include "base/Exception.h"

namespace QSX {

namespace Client {

using QSX::Exception::QSXException;
using std::string;

namespace {

// Length of the leading "scheme:" including the colon, 0 if there is none
size_t SchemeLength(const string &uri) {
  if (uri.empty() || !isalpha(static_cast<unsigned char>(uri[0]))) {
    return 0;
  }
  for (size_t i = 1; i < uri.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(uri[i]);
    if (c == ':') {
      return i + 1;
    }
    if (!isalnum(c) && c != '+' && c != '.' && c != '-') {
      return 0;
    }
  }
  return 0;
}

}  // namespace

// --------------------------------------------------------------------------
ObjectPath ParseObjectURI(const string &uri) {
  size_t schemeLen = SchemeLength(uri);
  if (schemeLen == 0) {
    throw QSXException("Invalid object uri, missing scheme: \"" + uri + "\"");
  }

  string rest = uri.substr(schemeLen);
  size_t slashes = 0;
  while (slashes < rest.size() && slashes < 2 && rest[slashes] == '/') {
    ++slashes;
  }
  rest = rest.substr(slashes);

  ObjectPath path;
  string::size_type delim = rest.find('/');
  string bucket = rest.substr(0, delim);
  if (!bucket.empty()) {
    path.bucket = bucket;
  }
  if (delim != string::npos && delim + 1 < rest.size()) {
    path.prefix = rest.substr(delim + 1);
  }
  return path;
}

// --------------------------------------------------------------------------
string ObjectPathToString(const ObjectPath &path) {
  string str = "qs://";
  if (path.bucket) {
    str += *path.bucket;
    if (path.prefix) {
      str += "/" + *path.prefix;
    }
  }
  return str;
}

}  // namespace Client
}  // namespace QSX
