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

#include "common.h"

namespace wtoken::vault
{
	// The wrapped interest-bearing token. Source of truth for the vault holdings, the pause flag and the ban list.
	// Queried live, no state is cached on the vault side.
	struct IRebasingAsset
	{
		typedef std::shared_ptr<IRebasingAsset> Ptr;

		virtual ~IRebasingAsset() {}

		virtual Address get_Address() const = 0;
		virtual Amount get_BalanceOf(const Address&) const = 0;
		virtual bool IsPaused() const = 0;
		virtual bool IsBanned(const Address&) const = 0;

		// Both throw if the transfer is rejected, with no effect on the asset state.
		// Spends the allowance 'from' granted to 'spender'
		virtual void TransferFrom(const Address& spender, const Address& from, const Address& to, const Amount&) = 0;
		virtual void Transfer(const Address& from, const Address& to, const Amount&) = 0;
	};

} // namespace wtoken::vault
