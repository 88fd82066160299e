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

#include "configure/Parser.h"

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/program_options.hpp"

#include "base/Exception.h"
#include "base/Logging.h"
#include "base/StringUtils.h"
#include "configure/Default.h"
#include "configure/Options.h"

namespace QSX {

namespace Configure {

namespace Parser {

namespace po = boost::program_options;

namespace {

using boost::to_string;
using QSX::Configure::Default::GetDefaultPort;
using QSX::Exception::QSXException;
using QSX::Logging::GetLogLevelByName;
using QSX::StringUtils::ToLower;
using QSX::StringUtils::ToUpper;
using std::string;
using std::vector;

// Number of arguments each command takes
size_t GetCommandArity(const string &command) {
  if (command == "upload" || command == "download" || command == "put" ||
      command == "get") {
    return 2;
  } else if (command == "cat" || command == "ls") {
    return 1;
  }
  return 0;
}

template <typename T>
void CheckPositive(const char *opt, T value) {
  if (value == 0) {
    throw QSXException(string("invalid parameter in option --") + opt +
                       "=" + to_string(value) + ", must be positive");
  }
}

bool IsLogLevelName(const string &name) {
  string upper = ToUpper(name);
  return upper == "INFO" || upper == "WARN" || upper == "WARNING" ||
         upper == "ERROR" || upper == "FATAL";
}

}  // namespace

void Parse(int argc, char **argv) {
  po::options_description desc("qsxfer Options");
  desc.add_options()
      ("chunk-size,s", po::value<uint64_t>(), "")
      ("max-chunks,m", po::value<uint32_t>(), "")
      ("workers,w", po::value<size_t>(), "")
      ("retries,r", po::value<uint16_t>(), "")
      ("file-size,S", po::value<uint64_t>(), "")
      ("size", po::bool_switch(), "")
      ("zone,z", po::value<string>(), "")
      ("host,H", po::value<string>(), "")
      ("protocol,p", po::value<string>(), "")
      ("port,P", po::value<uint16_t>(), "")
      ("agent,a", po::value<string>(), "")
      ("access-key-id,k", po::value<string>(), "")
      ("secret-key,K", po::value<string>(), "")
      ("sdk-retries", po::value<uint16_t>(), "")
      ("reqtimeout,R", po::value<uint32_t>(), "")
      ("logdir,l", po::value<string>(), "")
      ("loglevel,L", po::value<string>(), "")
      ("debug,d", po::bool_switch(), "")
      ("help,h", po::bool_switch(), "")
      ("version,V", po::bool_switch(), "")
      ("command", po::value<string>(), "")
      ("args", po::value<vector<string> >(), "");

  po::positional_options_description pod;
  pod.add("command", 1);
  pod.add("args", -1);

  po::variables_map vm;
  try {
    po::store(
        po::command_line_parser(argc, argv).options(desc).positional(pod).run(),
        vm);
    po::notify(vm);
  } catch (const po::error &err) {
    throw QSXException(err.what());
  }

  Options &options = Options::Instance();
  options.SetShowHelp(vm["help"].as<bool>());
  options.SetShowVersion(vm["version"].as<bool>());
  options.SetDebug(vm["debug"].as<bool>());
  options.SetListWithSize(vm["size"].as<bool>());

  if (vm.count("chunk-size")) {
    CheckPositive("chunk-size", vm["chunk-size"].as<uint64_t>());
    options.SetChunkSize(vm["chunk-size"].as<uint64_t>());
  }
  if (vm.count("max-chunks")) {
    CheckPositive("max-chunks", vm["max-chunks"].as<uint32_t>());
    options.SetMaxChunks(vm["max-chunks"].as<uint32_t>());
  }
  if (vm.count("workers")) {
    CheckPositive("workers", vm["workers"].as<size_t>());
    options.SetWorkerBudget(vm["workers"].as<size_t>());
  }
  if (vm.count("retries")) {
    CheckPositive("retries", vm["retries"].as<uint16_t>());
    options.SetChunkMaxRetries(vm["retries"].as<uint16_t>());
  }
  if (vm.count("file-size")) {
    options.SetFileSize(vm["file-size"].as<uint64_t>());
  }

  if (vm.count("zone")) {
    options.SetZone(vm["zone"].as<string>());
  }
  if (vm.count("host")) {
    options.SetHost(vm["host"].as<string>());
  }
  if (vm.count("protocol")) {
    string protocol = ToLower(vm["protocol"].as<string>());
    if (protocol != "https" && protocol != "http") {
      throw QSXException("invalid parameter in option --protocol=" +
                         vm["protocol"].as<string>() +
                         ", could be https or http");
    }
    options.SetProtocol(protocol);
  }
  options.SetPort(vm.count("port") ? vm["port"].as<uint16_t>()
                                   : GetDefaultPort(options.GetProtocol()));
  if (vm.count("agent")) {
    options.SetAdditionalAgent(vm["agent"].as<string>());
  }
  if (vm.count("access-key-id")) {
    options.SetAccessKeyId(vm["access-key-id"].as<string>());
  }
  if (vm.count("secret-key")) {
    options.SetSecretKey(vm["secret-key"].as<string>());
  }
  if (vm.count("sdk-retries")) {
    options.SetRetries(vm["sdk-retries"].as<uint16_t>());
  }
  if (vm.count("reqtimeout")) {
    CheckPositive("reqtimeout", vm["reqtimeout"].as<uint32_t>());
    options.SetRequestTimeOut(vm["reqtimeout"].as<uint32_t>());
  }

  if (vm.count("logdir")) {
    options.SetLogDirectory(vm["logdir"].as<string>());
  }
  if (vm.count("loglevel")) {
    string name = vm["loglevel"].as<string>();
    if (!IsLogLevelName(name)) {
      throw QSXException("invalid parameter in option --loglevel=" + name +
                         ", could be INFO, WARN, ERROR or FATAL");
    }
    options.SetLogLevel(GetLogLevelByName(name));
  }

  if (options.IsNoTransfer()) {
    return;
  }

  if (!vm.count("command")) {
    throw QSXException("Missing COMMAND parameter");
  }
  string command = vm["command"].as<string>();
  size_t arity = GetCommandArity(command);
  if (arity == 0) {
    throw QSXException("Unknown command " + command);
  }
  vector<string> args;
  if (vm.count("args")) {
    args = vm["args"].as<vector<string> >();
  }
  if (args.size() != arity) {
    throw QSXException("Command " + command + " takes " + to_string(arity) +
                       " arguments, " + to_string(args.size()) + " given");
  }
  options.SetCommand(command);
  options.SetArguments(args);
}

}  // namespace Parser
}  // namespace Configure
}  // namespace QSX
