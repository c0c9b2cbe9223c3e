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

#include "rebasing_asset.h"

namespace wtoken::vault
{
	// Pause and ban policy applied to every share movement. Mint and burn pass the zero address as the missing party
	class TransferGate
	{
	public:
		void set_Asset(const IRebasingAsset::Ptr&);

		void set_LocalPaused(bool b) { m_LocalPaused = b; }
		bool get_LocalPaused() const { return m_LocalPaused; }

		// local flag OR the asset flag, the latter read on every call
		bool IsPaused() const;

		void Check(const Address& from, const Address& to) const;

	private:
		IRebasingAsset& get_Asset() const;

		IRebasingAsset::Ptr m_pAsset;
		bool m_LocalPaused = false;
	};

} // namespace wtoken::vault
