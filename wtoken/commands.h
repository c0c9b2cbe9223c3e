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

#include "utility/cli/options.h"
#include <ostream>

namespace wtoken
{
	// Executes the command named by cli::COMMAND, prints its results to os.
	// Returns the process exit code. Throws std::runtime_error on malformed option values
	int RunCommand(const po::variables_map& vm, std::ostream& os);
}
