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

#ifndef QSXFER_CLIENT_CLIENTCONFIGURATION_H_
#define QSXFER_CLIENT_CLIENTCONFIGURATION_H_

#include <stdint.h>

#include <string>

namespace QSX {

namespace Configure {
class Options;
}  // namespace Configure

namespace Client {

struct ClientLogLevel {  // SDK log level
  enum Value {
    Verbose = -2,
    Debug = -1,
    Info = 0,
    Warn = 1,
    Error = 2,
    Fatal = 3
  };
};

//
// ClientConfiguration
//
// Connection settings of the QingStor binding. Credentials are taken as
// given, no lookup is done.
//
class ClientConfiguration {
 public:
  ClientConfiguration();
  ClientConfiguration(const std::string &accessKeyId,
                      const std::string &secretKey);

  // Build from parsed command line options
  static ClientConfiguration FromOptions(
      const QSX::Configure::Options &options);

 public:
  // accessor
  const std::string &GetAccessKeyId() const { return m_accessKeyId; }
  const std::string &GetSecretKey() const { return m_secretKey; }
  const std::string &GetZone() const { return m_zone; }
  const std::string &GetHost() const { return m_host; }
  const std::string &GetProtocol() const { return m_protocol; }
  uint16_t GetPort() const { return m_port; }
  const std::string &GetAdditionalAgent() const {
    return m_additionalUserAgent;
  }
  ClientLogLevel::Value GetClientLogLevel() const { return m_logLevel; }
  const std::string &GetClientLogDirectory() const { return m_sdkLogDirectory; }
  uint16_t GetTransactionRetries() const { return m_transactionRetries; }
  uint32_t GetTransactionTimeDuration() const {
    return m_transactionTimeDuration;
  }

  // mutator
  void SetZone(const std::string &zone) { m_zone = zone; }
  void SetHost(const std::string &host) { m_host = host; }
  void SetProtocol(const std::string &protocol) { m_protocol = protocol; }
  void SetPort(uint16_t port) { m_port = port; }
  void SetAdditionalAgent(const std::string &agent) {
    m_additionalUserAgent = agent;
  }
  void SetClientLogLevel(ClientLogLevel::Value level) { m_logLevel = level; }
  void SetClientLogDirectory(const std::string &dir) {
    m_sdkLogDirectory = dir;
  }
  void SetTransactionRetries(uint16_t retries) {
    m_transactionRetries = retries;
  }
  void SetTransactionTimeDuration(uint32_t seconds) {
    m_transactionTimeDuration = seconds;
  }

 private:
  std::string m_accessKeyId;
  std::string m_secretKey;
  std::string m_zone;  // zone or region
  std::string m_host;
  std::string m_protocol;
  uint16_t m_port;
  std::string m_additionalUserAgent;
  ClientLogLevel::Value m_logLevel;
  std::string m_sdkLogDirectory;

  uint16_t m_transactionRetries;       // sdk connection retries
  uint32_t m_transactionTimeDuration;  // one connection, in seconds
};

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_CLIENTCONFIGURATION_H_
