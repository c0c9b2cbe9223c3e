// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <boost/program_options.hpp>
#include <boost/optional.hpp>
#include "utility/logger.h"

namespace po = boost::program_options;

namespace wtoken
{
    namespace cli
    {
        extern const char* HELP;
        extern const char* HELP_FULL;
        extern const char* VERSION;
        extern const char* VERSION_FULL;
        extern const char* CONFIG_FILE_PATH;
        extern const char* LOG_LEVEL;
        extern const char* FILE_LOG_LEVEL;
        extern const char* LOG_INFO;
        extern const char* LOG_DEBUG;
        extern const char* LOG_ERROR;
        extern const char* LOG_WARNING;
        extern const char* LOG_VERBOSE;
        extern const char* COMMAND;

        // commands
        extern const char* CMD_DOMAIN;
        extern const char* CMD_PERMIT_DIGEST;
        extern const char* CMD_SIGN_PERMIT;
        extern const char* CMD_PREVIEW;

        // token domain
        extern const char* NAME;
        extern const char* CHAIN_ID;
        extern const char* CONTRACT;

        // permit
        extern const char* OWNER;
        extern const char* SPENDER;
        extern const char* VALUE;
        extern const char* NONCE;
        extern const char* DEADLINE;
        extern const char* SECRET;

        // preview
        extern const char* AMOUNT;
        extern const char* TOTAL_ASSETS;
        extern const char* TOTAL_SUPPLY;
        extern const char* WEI;
    }

    enum OptionsFlag : int
    {
        GENERAL_OPTIONS = 1 << 0,
        DOMAIN_OPTIONS  = 1 << 1,
        PERMIT_OPTIONS  = 1 << 2,
        PREVIEW_OPTIONS = 1 << 3,
        ALL_OPTIONS     = GENERAL_OPTIONS | DOMAIN_OPTIONS | PERMIT_OPTIONS | PREVIEW_OPTIONS
    };

    // returns {all options, options visible in help}
    std::pair<po::options_description, po::options_description> createOptionsDescription(int flags = ALL_OPTIONS, const std::string& configFile = {});

    // Parses the command line (the first positional argument is the command), then the config file.
    // Values from the command line are preferred
    po::variables_map getOptions(int argc, char* argv[], const po::options_description& options);

    boost::optional<std::string> ReadCfgFromFile(po::variables_map&, const po::options_description&);
    boost::optional<std::string> ReadCfgFromFile(po::variables_map&, const po::options_description&, const char* szFile);

    int getLogLevel(const std::string &dstLog, const po::variables_map& vm, int defaultValue = LOG_LEVEL_INFO);

    // reads a line from the terminal without echo
    void read_secret(const char* prompt, std::string& out);
}
