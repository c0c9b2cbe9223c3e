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

#include "transfer_gate.h"
#include "utility/logger.h"

namespace wtoken::vault
{
	void TransferGate::set_Asset(const IRebasingAsset::Ptr& pAsset)
	{
		m_pAsset = pAsset;
	}

	IRebasingAsset& TransferGate::get_Asset() const
	{
		if (!m_pAsset)
			throw VaultException("wToken: not initialized", VaultException::Type::NotInitialized);
		return *m_pAsset;
	}

	bool TransferGate::IsPaused() const
	{
		return m_LocalPaused || get_Asset().IsPaused();
	}

	void TransferGate::Check(const Address& from, const Address& to) const
	{
		if (IsPaused())
		{
			LOG_WARNING() << "Transfer " << Eth::ToString(from) << " -> " << Eth::ToString(to) << " rejected, paused";
			throw VaultException("wToken: transfers paused", VaultException::Type::TransfersPaused);
		}

		IRebasingAsset& asset = get_Asset();

		if ((from != Zero) && asset.IsBanned(from))
		{
			LOG_WARNING() << "Transfer from banned " << Eth::ToString(from) << " rejected";
			throw BlockedAccountException(from, true);
		}

		if ((to != Zero) && asset.IsBanned(to))
		{
			LOG_WARNING() << "Transfer to banned " << Eth::ToString(to) << " rejected";
			throw BlockedAccountException(to, false);
		}
	}

} // namespace wtoken::vault
