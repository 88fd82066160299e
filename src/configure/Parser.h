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

#ifndef QSXFER_CONFIGURE_PARSER_H_
#define QSXFER_CONFIGURE_PARSER_H_

namespace QSX {

namespace Configure {

namespace Parser {

// Parse command line into Options
//
// @param  : argc, argv
// @return : none
//
// Throw QSXException on an unknown option, an invalid value, an unknown
// command or a wrong number of command arguments.
void Parse(int argc, char **argv);

}  // namespace Parser
}  // namespace Configure
}  // namespace QSX

#endif  // QSXFER_CONFIGURE_PARSER_H_
