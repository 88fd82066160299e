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

#include "client/ClientConfiguration.h"

#include <string>

#include "base/Utils.h"
#include "configure/Default.h"
#include "configure/Options.h"

namespace QSX {

namespace Client {

using QSX::Configure::Default::GetDefaultHostName;
using QSX::Configure::Default::GetDefaultPort;
using QSX::Configure::Default::GetDefaultProtocolName;
using QSX::Configure::Default::GetDefaultTransactionRetries;
using QSX::Configure::Default::GetDefaultTransactionTimeDuration;
using QSX::Configure::Default::GetDefaultZone;
using QSX::Configure::Options;
using std::string;

// --------------------------------------------------------------------------
ClientConfiguration::ClientConfiguration()
    : m_accessKeyId(),
      m_secretKey(),
      m_zone(GetDefaultZone()),
      m_host(GetDefaultHostName()),
      m_protocol(GetDefaultProtocolName()),
      m_port(GetDefaultPort(GetDefaultProtocolName())),
      m_additionalUserAgent(),
      m_logLevel(ClientLogLevel::Warn),
      m_sdkLogDirectory(),
      m_transactionRetries(GetDefaultTransactionRetries()),
      m_transactionTimeDuration(GetDefaultTransactionTimeDuration()) {}

// --------------------------------------------------------------------------
ClientConfiguration::ClientConfiguration(const string &accessKeyId,
                                         const string &secretKey)
    : m_accessKeyId(accessKeyId),
      m_secretKey(secretKey),
      m_zone(GetDefaultZone()),
      m_host(GetDefaultHostName()),
      m_protocol(GetDefaultProtocolName()),
      m_port(GetDefaultPort(GetDefaultProtocolName())),
      m_additionalUserAgent(),
      m_logLevel(ClientLogLevel::Warn),
      m_sdkLogDirectory(),
      m_transactionRetries(GetDefaultTransactionRetries()),
      m_transactionTimeDuration(GetDefaultTransactionTimeDuration()) {}

// --------------------------------------------------------------------------
ClientConfiguration ClientConfiguration::FromOptions(const Options &options) {
  ClientConfiguration config(options.GetAccessKeyId(), options.GetSecretKey());
  config.SetZone(options.GetZone());
  config.SetHost(options.GetHost());
  config.SetProtocol(options.GetProtocol());
  config.SetPort(options.GetPort());
  config.SetAdditionalAgent(options.GetAdditionalAgent());
  config.SetTransactionRetries(options.GetRetries());
  config.SetTransactionTimeDuration(options.GetRequestTimeOut());
  config.SetClientLogLevel(options.IsDebug() ? ClientLogLevel::Debug
                                             : ClientLogLevel::Warn);
  if (!options.GetLogDirectory().empty()) {
    config.SetClientLogDirectory(
        QSX::Utils::AppendPathDelim(options.GetLogDirectory()) + "sdk.log");
  }
  return config;
}

}  // namespace Client
}  // namespace QSX
