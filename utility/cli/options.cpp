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

#include "options.h"

#include <boost/filesystem.hpp>
#include <fstream>
#include <iostream>
#include <map>
#if defined _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#else
    #include <unistd.h>
    #include <termios.h>
#endif

using namespace std;

namespace
{
#ifndef WIN32
    int getch()
    {
        int ch;
        struct termios t_old, t_new;

        tcgetattr(STDIN_FILENO, &t_old);
        t_new = t_old;
        t_new.c_lflag &= ~(ICANON | ECHO);
        tcsetattr(STDIN_FILENO, TCSANOW, &t_new);

        ch = getchar();

        tcsetattr(STDIN_FILENO, TCSANOW, &t_old);
        return ch;
    }
#endif
}

namespace wtoken
{
    namespace cli
    {
        const char* HELP = "help";
        const char* HELP_FULL = "help,h";
        const char* VERSION = "version";
        const char* VERSION_FULL = "version,v";
        const char* CONFIG_FILE_PATH = "config_file";
        const char* LOG_LEVEL = "log_level";
        const char* FILE_LOG_LEVEL = "file_log_level";
        const char* LOG_INFO = "info";
        const char* LOG_DEBUG = "debug";
        const char* LOG_ERROR = "error";
        const char* LOG_WARNING = "warning";
        const char* LOG_VERBOSE = "verbose";
        const char* COMMAND = "command";

        const char* CMD_DOMAIN = "domain";
        const char* CMD_PERMIT_DIGEST = "permit_digest";
        const char* CMD_SIGN_PERMIT = "sign_permit";
        const char* CMD_PREVIEW = "preview";

        const char* NAME = "name";
        const char* CHAIN_ID = "chain_id";
        const char* CONTRACT = "contract";

        const char* OWNER = "owner";
        const char* SPENDER = "spender";
        const char* VALUE = "value";
        const char* NONCE = "nonce";
        const char* DEADLINE = "deadline";
        const char* SECRET = "secret";

        const char* AMOUNT = "amount";
        const char* TOTAL_ASSETS = "total_assets";
        const char* TOTAL_SUPPLY = "total_supply";
        const char* WEI = "wei";
    }

    pair<po::options_description, po::options_description> createOptionsDescription(int flags, const string& configFile)
    {
        po::options_description general_options("General options");
        general_options.add_options()
            (cli::HELP_FULL, "list all available options and commands")
            (cli::VERSION_FULL, "print project version")
            (cli::COMMAND, po::value<string>(), "command to execute [domain|permit_digest|sign_permit|preview]")
            (cli::LOG_LEVEL, po::value<string>(), "set log level [error|warning|info(default)|debug|verbose]")
            (cli::FILE_LOG_LEVEL, po::value<string>(), "set file log level [error|warning|info|debug|verbose], no file log by default")
            (cli::CONFIG_FILE_PATH, po::value<string>()->default_value(configFile), "path to the config file");

        po::options_description domain_options("Token domain options");
        domain_options.add_options()
            (cli::NAME, po::value<string>()->default_value("Wrapped OpenEden Protocol USD"), "token name, as used in the signing domain")
            (cli::CHAIN_ID, po::value<uint64_t>()->default_value(1), "chain id")
            (cli::CONTRACT, po::value<string>(), "address of the token contract (0x-prefixed)");

        po::options_description permit_options("Permit options");
        permit_options.add_options()
            (cli::OWNER, po::value<string>(), "address of the owner granting the allowance")
            (cli::SPENDER, po::value<string>(), "address of the spender")
            (cli::VALUE, po::value<string>(), "allowance value, in token units unless --wei is set (max for unlimited)")
            (cli::NONCE, po::value<uint64_t>()->default_value(0), "current nonce of the owner")
            (cli::DEADLINE, po::value<uint64_t>(), "unix time after which the permit is invalid (unlimited if not specified)")
            (cli::SECRET, po::value<string>(), "secret key of the owner, hex. Requested from the terminal if not specified");

        po::options_description preview_options("Preview options");
        preview_options.add_options()
            (cli::AMOUNT, po::value<string>(), "amount to convert, in token units unless --wei is set")
            (cli::TOTAL_ASSETS, po::value<string>()->default_value("0"), "assets held by the vault, in token units unless --wei is set")
            (cli::TOTAL_SUPPLY, po::value<string>()->default_value("0"), "total supply of the vault shares, in token units unless --wei is set");

        po::options_description amount_options("Amount options");
        amount_options.add_options()
            (cli::WEI, po::bool_switch()->default_value(false), "amounts are given and printed in base units instead of token units");

        po::options_description options{ "Allowed options" };
        po::options_description visible_options{ "Allowed options" };

        if (flags & GENERAL_OPTIONS)
        {
            options.add(general_options);
            visible_options.add(general_options);
        }

        if (flags & DOMAIN_OPTIONS)
        {
            options.add(domain_options);
            visible_options.add(domain_options);
        }

        if (flags & PERMIT_OPTIONS)
        {
            options.add(permit_options);
            visible_options.add(permit_options);
        }

        if (flags & PREVIEW_OPTIONS)
        {
            options.add(preview_options);
            visible_options.add(preview_options);
        }

        if (flags & (PERMIT_OPTIONS | PREVIEW_OPTIONS))
        {
            options.add(amount_options);
            visible_options.add(amount_options);
        }

        return { options, visible_options };
    }

    boost::optional<string> ReadCfgFromFile(po::variables_map& vm, const po::options_description& desc)
    {
        return ReadCfgFromFile(vm, desc, vm[cli::CONFIG_FILE_PATH].as<string>().c_str());
    }

    boost::optional<string> ReadCfgFromFile(po::variables_map& vm, const po::options_description& desc, const char* szFile)
    {
        if (!szFile || !*szFile)
            return boost::none;

        const auto fullPath = boost::filesystem::system_complete(szFile).string();
        ifstream cfg(fullPath);
        if (!cfg)
            return boost::none;

        cout << "Reading config from " << fullPath << endl;
        po::store(po::parse_config_file(cfg, desc), vm);
        return fullPath;
    }

    po::variables_map getOptions(int argc, char* argv[], const po::options_description& options)
    {
        po::variables_map vm;
        po::positional_options_description positional;
        po::command_line_parser parser(argc, argv);
        parser.options(options);
        parser.style(po::command_line_style::default_style ^ po::command_line_style::allow_guessing);
        positional.add(cli::COMMAND, 1);
        parser.positional(positional);
        po::store(parser.run(), vm); // value stored first is preferred

        ReadCfgFromFile(vm, options);

        return vm;
    }

    int getLogLevel(const string &dstLog, const po::variables_map& vm, int defaultValue)
    {
        const map<string, int> logLevels
        {
            { cli::LOG_ERROR, LOG_LEVEL_ERROR },
            { cli::LOG_WARNING, LOG_LEVEL_WARNING },
            { cli::LOG_DEBUG, LOG_LEVEL_DEBUG },
            { cli::LOG_INFO, LOG_LEVEL_INFO },
            { cli::LOG_VERBOSE, LOG_LEVEL_VERBOSE }
        };

        if (vm.count(dstLog))
        {
            auto level = vm[dstLog].as<string>();
            if (auto it = logLevels.find(level); it != logLevels.end())
            {
                return it->second;
            }
        }

        return defaultValue;
    }

    void read_secret(const char* prompt, string& out)
    {
        cout << prompt;

        const size_t maxLen = 128;
        unsigned char ch = 0;

#ifdef WIN32

        static const char BACKSPACE = 8;
        static const char RETURN = 13;

        DWORD con_mode;
        DWORD dwRead;
        HANDLE hIn = GetStdHandle(STD_INPUT_HANDLE);

        GetConsoleMode(hIn, &con_mode);
        SetConsoleMode(hIn, con_mode & ~(ENABLE_ECHO_INPUT | ENABLE_LINE_INPUT));

        while (ReadConsoleA(hIn, &ch, 1, &dwRead, NULL) && ch != RETURN && out.size() < maxLen) {
            if (ch == BACKSPACE) {
                if (out.size() > 0) {
                    cout << "\b \b";
                    out.pop_back();
                }
            }
            else {
                out.push_back((char)ch);
                cout << '*';
            }
        }

        GetConsoleMode(hIn, &con_mode);
        SetConsoleMode(hIn, con_mode | (ENABLE_ECHO_INPUT | ENABLE_LINE_INPUT));

#else
        static const char BACKSPACE = 127;
        static const char RETURN = 10;

        int c;
        while ((c = getch()) != EOF && (ch = static_cast<unsigned char>(c)) != RETURN && out.size() < maxLen)
        {
            if (ch == BACKSPACE) {
                if (out.size() > 0) {
                    cout << "\b \b";
                    out.pop_back();
                }
            }
            else {
                out.push_back((char)ch);
                cout << '*';
            }
        }

#endif

        cout << endl;
    }
}
