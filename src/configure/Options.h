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

#ifndef QSXFER_CONFIGURE_OPTIONS_H_
#define QSXFER_CONFIGURE_OPTIONS_H_

#include <stddef.h>
#include <stdint.h>  // for uint16_t

#include <ostream>
#include <string>
#include <vector>

#include "base/Logging.h"
#include "base/Singleton.hpp"

namespace QSX {

namespace Configure {

namespace Parser {
void Parse(int argc, char **argv);
}  // namespace Parser

using QSX::Logging::LogLevel;

class Options : public Singleton<Options> {
 public:
  ~Options() {}

 public:
  bool IsNoTransfer() const { return m_showHelp || m_showVersion; }

  // accessor
  const std::string &GetCommand() const { return m_command; }
  const std::vector<std::string> &GetArguments() const { return m_arguments; }
  const std::string &GetZone() const { return m_zone; }
  const std::string &GetHost() const { return m_host; }
  const std::string &GetProtocol() const { return m_protocol; }
  uint16_t GetPort() const { return m_port; }
  const std::string &GetAccessKeyId() const { return m_accessKeyId; }
  const std::string &GetSecretKey() const { return m_secretKey; }
  const std::string &GetAdditionalAgent() const { return m_additionalAgent; }
  uint16_t GetRetries() const { return m_retries; }
  uint32_t GetRequestTimeOut() const { return m_requestTimeOut; }
  uint64_t GetChunkSize() const { return m_chunkSize; }
  uint32_t GetMaxChunks() const { return m_maxChunks; }
  size_t GetWorkerBudget() const { return m_workerBudget; }
  uint16_t GetChunkMaxRetries() const { return m_chunkMaxRetries; }
  uint64_t GetFileSize() const { return m_fileSize; }
  const std::string &GetLogDirectory() const { return m_logDirectory; }
  LogLevel::Value GetLogLevel() const { return m_logLevel; }
  bool IsListWithSize() const { return m_listWithSize; }
  bool IsDebug() const { return m_debug; }
  bool IsShowHelp() const { return m_showHelp; }
  bool IsShowVersion() const { return m_showVersion; }

 private:
  Options();

  // mutator
  void SetCommand(const std::string &command) { m_command = command; }
  void SetArguments(const std::vector<std::string> &args) {
    m_arguments = args;
  }
  void SetZone(const std::string &zone) { m_zone = zone; }
  void SetHost(const std::string &host) { m_host = host; }
  void SetProtocol(const std::string &protocol) { m_protocol = protocol; }
  void SetPort(uint16_t port) { m_port = port; }
  void SetAccessKeyId(const std::string &id) { m_accessKeyId = id; }
  void SetSecretKey(const std::string &key) { m_secretKey = key; }
  void SetAdditionalAgent(const std::string &agent) {
    m_additionalAgent = agent;
  }
  void SetRetries(uint16_t retries) { m_retries = retries; }
  void SetRequestTimeOut(uint32_t timeout) { m_requestTimeOut = timeout; }
  void SetChunkSize(uint64_t size) { m_chunkSize = size; }
  void SetMaxChunks(uint32_t maxChunks) { m_maxChunks = maxChunks; }
  void SetWorkerBudget(size_t budget) { m_workerBudget = budget; }
  void SetChunkMaxRetries(uint16_t retries) { m_chunkMaxRetries = retries; }
  void SetFileSize(uint64_t size) { m_fileSize = size; }
  void SetLogDirectory(const std::string &path) { m_logDirectory = path; }
  void SetLogLevel(LogLevel::Value level) { m_logLevel = level; }
  void SetListWithSize(bool withSize) { m_listWithSize = withSize; }
  void SetDebug(bool debug) { m_debug = debug; }
  void SetShowHelp(bool showHelp) { m_showHelp = showHelp; }
  void SetShowVersion(bool showVersion) { m_showVersion = showVersion; }

  std::string m_command;  // upload, download, put, get, cat, ls
  std::vector<std::string> m_arguments;
  std::string m_zone;
  std::string m_host;
  std::string m_protocol;
  uint16_t m_port;
  std::string m_accessKeyId;
  std::string m_secretKey;
  std::string m_additionalAgent;
  uint16_t m_retries;         // sdk connection retries
  uint32_t m_requestTimeOut;  // in seconds
  uint64_t m_chunkSize;
  uint32_t m_maxChunks;
  size_t m_workerBudget;
  uint16_t m_chunkMaxRetries;
  uint64_t m_fileSize;  // 0 means stat the local file
  std::string m_logDirectory;  // log to console if empty
  LogLevel::Value m_logLevel;
  bool m_listWithSize;
  bool m_debug;
  bool m_showHelp;
  bool m_showVersion;

  friend class Singleton<Options>;
  friend void QSX::Configure::Parser::Parse(int argc, char **argv);
  friend std::ostream &operator<<(std::ostream &os, const Options &opts);
};

std::ostream &operator<<(std::ostream &os, const Options &opts);

}  // namespace Configure
}  // namespace QSX

#endif  // QSXFER_CONFIGURE_OPTIONS_H_
