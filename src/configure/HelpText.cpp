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

#include "configure/HelpText.h"

#include <iostream>
#include <string>

#include "boost/exception/to_string.hpp"

#include "configure/Default.h"

namespace QSX {

namespace Configure {

namespace HelpText {

using boost::to_string;
using QSX::Configure::Default::GetDefaultChunkMaxRetries;
using QSX::Configure::Default::GetDefaultChunkSize;
using QSX::Configure::Default::GetDefaultHostName;
using QSX::Configure::Default::GetDefaultLogDirectory;
using QSX::Configure::Default::GetDefaultLogLevelName;
using QSX::Configure::Default::GetDefaultMaxChunks;
using QSX::Configure::Default::GetDefaultProtocolName;
using QSX::Configure::Default::GetDefaultTransactionRetries;
using QSX::Configure::Default::GetDefaultTransactionTimeDuration;
using QSX::Configure::Default::GetDefaultWorkerBudget;
using QSX::Configure::Default::GetDefaultZone;
using QSX::Configure::Default::GetProgramVersion;
using std::cout;
using std::endl;

void ShowQSXferVersion() {
  cout << "qsxfer version: " << GetProgramVersion() << endl;
}

void ShowQSXferHelp() {
  cout <<
  "Transfer objects between local files and a QingStor bucket.\n";
  ShowQSXferUsage();
  cout <<
  "\n"
  "Commands:\n"
  "  upload   <FILE> <qs://BUCKET/KEY>   Chunked multipart upload\n"
  "  download <qs://BUCKET/KEY> <FILE>   Chunked ranged download\n"
  "  put      <FILE> <qs://BUCKET/KEY>   Upload in a single request\n"
  "  get      <qs://BUCKET/KEY> <FILE>   Download in a single request\n"
  "  cat      <qs://BUCKET/KEY>          Print object, nothing if it is absent\n"
  "  ls       <qs://BUCKET[/PREFIX]>     List keys under prefix\n"
  "\n"
  "Transfer Options:\n"
  "  -s, --chunk-size   Bytes per chunk, default value is "
                        << to_string(GetDefaultChunkSize()) << "\n"
  "  -m, --max-chunks   Max number of chunks per object, default value is "
                        << to_string(GetDefaultMaxChunks()) << "\n"
  "  -w, --workers      Max number of chunks in flight, default value is "
                        << to_string(GetDefaultWorkerBudget()) << "\n"
  "  -r, --retries      Attempts per chunk, default value is "
                        << to_string(GetDefaultChunkMaxRetries()) << "\n"
  "  -S, --file-size    Upload size in bytes, default is the local file size\n"
  "      --size         ls prints the size of each key\n"
  "\n"
  "Connection Options:\n"
  "  -z, --zone         Zone or region, default value is " << GetDefaultZone() << "\n"
  "  -H, --host         Host name, default value is " << GetDefaultHostName() << "\n"
  "  -p, --protocol     Protocol could be https or http, default value is "
                        << GetDefaultProtocolName() << "\n"
  "  -P, --port         Specify port, default is 443 for https and 80 for http\n"
  "  -a, --agent        Additional user agent\n"
  "  -k, --access-key-id  Access key id\n"
  "  -K, --secret-key     Secret access key\n"
  "      --sdk-retries  Connection retries of a request, default value is "
                        << to_string(GetDefaultTransactionRetries()) << "\n"
  "  -R, --reqtimeout   Time(seconds) to wait before timing out a request,\n"
  "                     default value is "
                        << to_string(GetDefaultTransactionTimeDuration()) << " seconds\n"
  "\n"
  "Miscellaneous Options:\n"
  "  -l, --logdir       Specify log directory, an empty value logs to STDERR,\n"
  "                     default path is " << GetDefaultLogDirectory() << "\n"
  "  -L, --loglevel     Min log level, one of INFO,WARN,ERROR,FATAL;\n"
  "                     " << GetDefaultLogLevelName() << " is set by default\n"
  "  -d, --debug        Turn on debug messages\n"
  "  -h, --help         Print qsxfer help\n"
  "  -V, --version      Print qsxfer version\n";
  cout.flush();
}

void ShowQSXferUsage() {
  cout <<
  "Usage: qsxfer [options] <COMMAND> <ARGS>\n"
  "       [-s|--chunk-size=[value]] [-m|--max-chunks=[value]]\n"
  "       [-w|--workers=[value]] [-r|--retries=[value]] [-S|--file-size=[value]]\n"
  "       [-z|--zone=[value]] [-H|--host=[value]] [-p|--protocol=[value]]\n"
  "       [-P|--port=[value]] [-a|--agent=[value]]\n"
  "       [-k|--access-key-id=[value]] [-K|--secret-key=[value]]\n"
  "       [-l|--logdir=[dir]] [-L|--loglevel=[INFO|WARN|ERROR|FATAL]]\n"
  "       [-d|--debug] [-h|--help] [-V|--version]\n";
}

}  // namespace HelpText
}  // namespace Configure
}  // namespace QSX
