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

#include <errno.h>
#include <stdint.h>

#include <exception>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/Logging.h"
#include "client/ClientConfiguration.h"
#include "client/Operations.h"
#include "client/QSClient.h"
#include "client/RetryStrategy.h"
#include "client/TransferHandle.h"
#include "client/TransferManager.h"
#include "client/URI.h"
#include "configure/Default.h"
#include "configure/HelpText.h"
#include "configure/Options.h"
#include "configure/Parser.h"

using QSX::Client::ClientConfiguration;
using QSX::Client::GetMessageForStoreError;
using QSX::Client::IsGoodStoreError;
using QSX::Client::ObjectPath;
using QSX::Client::ParseObjectURI;
using QSX::Client::QSClient;
using QSX::Client::RetryStrategy;
using QSX::Client::StoreClientError;
using QSX::Client::TransferHandle;
using QSX::Client::TransferManager;
using QSX::Client::TransferManagerConfigure;
using QSX::Configure::Default::GetDefaultRetryScaleFactor;
using QSX::Configure::Default::GetProgramName;
using QSX::Configure::HelpText::ShowQSXferHelp;
using QSX::Configure::HelpText::ShowQSXferUsage;
using QSX::Configure::HelpText::ShowQSXferVersion;
using QSX::Configure::Options;
using QSX::Exception::QSXException;
using std::string;
using std::vector;

namespace {
int RunCommand(const Options &options);

struct ErrorHandle {
  int *ret;
  ErrorHandle(int *ret_) : ret(ret_) {}

  void operator()(const char *err) {
    if (ret) {
      *ret = errno != 0 ? errno : 1;
    }
    if (err) {
      std::cerr << "[" << GetProgramName() << " ERROR] " << err << "\n";
    }
  }
};
}  // namespace

int main(int argc, char **argv) {
  int ret = 0;
  ErrorHandle errorHandle(&ret);

  // Parse command line arguments.
  try {
    QSX::Configure::Parser::Parse(argc, argv);
  } catch (const QSXException &err) {
    ShowQSXferUsage();
    errorHandle(err.what());
    return ret;
  }

  const Options &options = Options::Instance();
  try {
    if (options.IsNoTransfer()) {
      if (options.IsShowVersion()) {
        ShowQSXferVersion();
      }
      if (options.IsShowHelp()) {
        ShowQSXferHelp();
      }
    } else {
      // Notice: DO NOT use logging before initialization done.
      QSX::Logging::Log &log = QSX::Logging::Log::Instance();
      log.Initialize(options.GetLogDirectory());
      log.SetLogLevel(options.GetLogLevel());
      log.SetDebug(options.IsDebug());
      DebugInfo(options);

      ret = RunCommand(options);
    }
  } catch (const QSXException &err) {
    errorHandle(err.what());
  } catch (const char *err) {
    errorHandle(err);
  } catch (const string &err) {
    errorHandle(err.c_str());
  } catch (const std::exception &err) {
    errorHandle(err.what());
  }
  return ret;
}

namespace {

// Get bucket and key of an object uri, both must be present
void GetBucketAndKey(const string &uri, string *bucket, string *key) {
  ObjectPath path = ParseObjectURI(uri);
  if (!path.bucket || !path.prefix) {
    throw "Object uri " + uri + " -- missing bucket or key";
  }
  *bucket = *path.bucket;
  *key = *path.prefix;
}

int ReportTransfer(const boost::shared_ptr<TransferHandle> &handle) {
  if (handle->IsCompleted()) {
    return 0;
  }
  std::cerr << "[" << GetProgramName() << " ERROR] " << handle->ToString()
            << "\n";
  return 1;
}

int ReportStoreError(const StoreClientError &err) {
  if (IsGoodStoreError(err)) {
    return 0;
  }
  std::cerr << "[" << GetProgramName() << " ERROR] "
            << GetMessageForStoreError(err) << "\n";
  return 1;
}

int RunCommand(const Options &options) {
  const string &command = options.GetCommand();
  const vector<string> &args = options.GetArguments();

  boost::shared_ptr<QSClient> client = boost::make_shared<QSClient>(
      ClientConfiguration::FromOptions(options),
      RetryStrategy(options.GetChunkMaxRetries(),
                    GetDefaultRetryScaleFactor()));

  string bucket;
  string key;
  if (command == "upload" || command == "download") {
    TransferManager manager(
        client, TransferManagerConfigure(
                    options.GetChunkSize(), options.GetMaxChunks(),
                    options.GetWorkerBudget(), options.GetChunkMaxRetries(),
                    GetDefaultRetryScaleFactor()));
    if (command == "upload") {
      GetBucketAndKey(args[1], &bucket, &key);
      return ReportTransfer(
          manager.UploadFile(args[0], bucket, key, options.GetFileSize()));
    }
    GetBucketAndKey(args[0], &bucket, &key);
    return ReportTransfer(manager.DownloadFile(bucket, key, args[1]));
  } else if (command == "put") {
    GetBucketAndKey(args[1], &bucket, &key);
    return ReportStoreError(
        QSX::Client::Operations::UploadFile(*client, bucket, args[0], key));
  } else if (command == "get") {
    GetBucketAndKey(args[0], &bucket, &key);
    return ReportStoreError(
        QSX::Client::Operations::DownloadFile(*client, bucket, key, args[1]));
  } else if (command == "cat") {
    GetBucketAndKey(args[0], &bucket, &key);
    vector<char> buffer;
    bool found = false;
    StoreClientError err = QSX::Client::Operations::TryGetObject(
        *client, bucket, key, &buffer, &found);
    if (IsGoodStoreError(err) && !found) {
      Warning("No object " << args[0]);
    } else if (!buffer.empty()) {
      std::cout.write(&buffer[0], buffer.size());
      std::cout.flush();
    }
    return ReportStoreError(err);
  } else if (command == "ls") {
    ObjectPath path = ParseObjectURI(args[0]);
    if (!path.bucket) {
      throw "Object uri " + args[0] + " -- missing bucket";
    }
    string prefix = path.prefix ? *path.prefix : string();
    if (options.IsListWithSize()) {
      QSX::Client::Operations::ListKeysToMapOutcome outcome =
          QSX::Client::Operations::ListKeysToMap(*client, *path.bucket, prefix);
      if (!outcome.IsSuccess()) {
        return ReportStoreError(outcome.GetError());
      }
      typedef std::map<string, uint64_t>::const_iterator Iter;
      for (Iter it = outcome.GetResult().begin();
           it != outcome.GetResult().end(); ++it) {
        std::cout << it->second << "\t" << it->first << "\n";
      }
      return 0;
    }
    QSX::Client::Operations::ListKeysOutcome outcome =
        QSX::Client::Operations::ListKeys(*client, *path.bucket, prefix);
    if (!outcome.IsSuccess()) {
      return ReportStoreError(outcome.GetError());
    }
    for (size_t i = 0; i < outcome.GetResult().size(); ++i) {
      std::cout << outcome.GetResult()[i] << "\n";
    }
    return 0;
  }

  ShowQSXferUsage();
  throw "Unknown command " + command;
}

}  // namespace
