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

#ifndef QSXFER_BASE_SIZE_H_
#define QSXFER_BASE_SIZE_H_

#include <stddef.h>  // for size_t
#include <stdint.h>  // for uint64_t

namespace QSX {

namespace Size {

// Binary units, used for local buffers.
static const uint64_t KB4 = 4 * 1024;
static const uint64_t MB1 = 1 * 1024 * 1024;

// Decimal units. Chunk sizes on the wire are expressed in these.
static const uint64_t K1 = 1 * 1000;
static const uint64_t M1 = 1 * 1000 * 1000;
static const uint64_t M5 = 5 * 1000 * 1000;
static const uint64_t M10 = 10 * 1000 * 1000;
static const uint64_t M25 = 25 * 1000 * 1000;

}  // namespace Size
}  // namespace QSX

#endif  // QSXFER_BASE_SIZE_H_
