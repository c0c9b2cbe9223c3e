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

#include "commands.h"
#include "vault/common.h"
#include "utility/logger.h"

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <iostream>

using namespace std;
using namespace wtoken;
using namespace wtoken::vault;

namespace
{
	void printHelp(const po::options_description& options)
	{
		cout << "Usage: wtoken-cli <command> [options]\n\n"
			"Commands:\n"
			"  domain          print the EIP-712 domain separator of the token\n"
			"  permit_digest   print the digest the owner signs for a permit\n"
			"  sign_permit     sign a permit with the owner key\n"
			"  preview         print the vault conversions for the given totals\n\n";
		cout << options << std::endl;
	}
}

int main(int argc, char* argv[])
{
	try
	{
		auto [options, visibleOptions] = createOptionsDescription(ALL_OPTIONS, "wtoken.cfg");

		po::variables_map vm;
		try
		{
			vm = getOptions(argc, argv, options);
		}
		catch (const po::error& e)
		{
			cout << e.what() << std::endl;
			printHelp(visibleOptions);

			return -1;
		}

		if (vm.count(cli::HELP))
		{
			printHelp(visibleOptions);

			return 0;
		}

		if (vm.count(cli::VERSION))
		{
			cout << PROJECT_VERSION << endl;
			return 0;
		}

		int logLevel = getLogLevel(cli::LOG_LEVEL, vm, LOG_LEVEL_INFO);
		int fileLogLevel = getLogLevel(cli::FILE_LOG_LEVEL, vm, LOG_SINK_DISABLED);

#define LOG_FILES_DIR "logs"
#define LOG_FILES_PREFIX "wtoken_"

		const auto path = boost::filesystem::system_complete(LOG_FILES_DIR);
		auto logger = wtoken::Logger::create(logLevel, logLevel, fileLogLevel, LOG_FILES_PREFIX, path.string());

		try
		{
			po::notify(vm);

			if (!vm.count(cli::COMMAND))
			{
				LOG_ERROR() << "Command is not specified";
				printHelp(visibleOptions);
				return -1;
			}

			return RunCommand(vm, cout);
		}
		catch (const po::error& e)
		{
			LOG_ERROR() << e.what();
			printHelp(visibleOptions);
		}
		catch (const VaultException& e)
		{
			LOG_ERROR() << e.what();
		}
		catch (const std::runtime_error& e)
		{
			LOG_ERROR() << e.what();
		}
	}
	catch (const std::exception& e)
	{
		std::cout << e.what() << std::endl;
	}

	return -1;
}
