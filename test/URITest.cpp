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

#include <string>

#include "gtest/gtest.h"

#include "base/Exception.h"
#include "client/URI.h"

namespace QSX {

namespace Client {

using QSX::Exception::QSXException;
using std::string;

void ExpectPath(const string &uri, const char *bucket, const char *prefix) {
  ObjectPath path = ParseObjectURI(uri);
  if (bucket == NULL) {
    EXPECT_FALSE(path.bucket) << uri;
  } else {
    ASSERT_TRUE(path.bucket) << uri;
    EXPECT_EQ(*path.bucket, bucket) << uri;
  }
  if (prefix == NULL) {
    EXPECT_FALSE(path.prefix) << uri;
  } else {
    ASSERT_TRUE(path.prefix) << uri;
    EXPECT_EQ(*path.prefix, prefix) << uri;
  }
}

TEST(URITest, Parse) {
  ExpectPath("qs://bucket/path/to/data/", "bucket", "path/to/data/");
  ExpectPath("qs://bucket/path/to/data", "bucket", "path/to/data");
  ExpectPath("qs://bucket/", "bucket", NULL);
  ExpectPath("qs://bucket", "bucket", NULL);
  ExpectPath("qs://", NULL, NULL);
}

TEST(URITest, AnyScheme) {
  ExpectPath("s3://bucket/key", "bucket", "key");
  ExpectPath("qingstor+https://bucket/a/b", "bucket", "a/b");
  ExpectPath("qs:bucket/key", "bucket", "key");
}

TEST(URITest, MissingScheme) {
  EXPECT_THROW(ParseObjectURI("bucket/path/to/data/"), QSXException);
  EXPECT_THROW(ParseObjectURI("foo"), QSXException);
  EXPECT_THROW(ParseObjectURI("qs"), QSXException);
  EXPECT_THROW(ParseObjectURI(""), QSXException);
  EXPECT_THROW(ParseObjectURI("1qs://bucket"), QSXException);
}

TEST(URITest, ToString) {
  EXPECT_EQ(ObjectPathToString(ParseObjectURI("s3://bucket/a/b")),
            "qs://bucket/a/b");
  EXPECT_EQ(ObjectPathToString(ParseObjectURI("qs://bucket")), "qs://bucket");
  EXPECT_EQ(ObjectPathToString(ObjectPath()), "qs://");
}

}  // namespace Client
}  // namespace QSX

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
