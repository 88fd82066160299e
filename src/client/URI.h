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

#ifndef QSXFER_CLIENT_URI_H_
#define QSXFER_CLIENT_URI_H_

#include <string>

#include "boost/optional.hpp"

namespace QSX {

namespace Client {

// Location of an object, or of a group of objects sharing a prefix
struct ObjectPath {
  boost::optional<std::string> bucket;
  boost::optional<std::string> prefix;
};

// Parse an object URI
//
// @param  : uri such as "qs://bucket/path/to/key"
// @return : ObjectPath
//
// The uri must start with a scheme, any scheme is accepted. Both bucket and
// prefix are absent when empty, "qs://bucket/" has a bucket and no prefix.
// Throw QSXException if the uri has no scheme.
ObjectPath ParseObjectURI(const std::string &uri);

// Get the display form of a path as "qs://bucket/prefix"
std::string ObjectPathToString(const ObjectPath &path);

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_URI_H_
