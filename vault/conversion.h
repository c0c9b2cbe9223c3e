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
	enum struct Rounding
	{
		Down,
		Up,
	};

	// Share/asset conversion over a snapshot of the vault totals.
	// 1:1 while there are no shares. Otherwise the ratio includes one virtual share and one virtual asset,
	// and every preview rounds in favor of the vault.
	class ConversionEngine
	{
	public:
		ConversionEngine(const Amount& totalAssets, const Amount& totalSupply);

		Amount ConvertToShares(const Amount& assets, Rounding = Rounding::Down) const;
		Amount ConvertToAssets(const Amount& shares, Rounding = Rounding::Down) const;

		// shares received for the deposited assets
		Amount PreviewDeposit(const Amount& assets) const { return ConvertToShares(assets, Rounding::Down); }
		// assets to pay for the minted shares
		Amount PreviewMint(const Amount& shares) const { return ConvertToAssets(shares, Rounding::Up); }
		// shares burned for the withdrawn assets
		Amount PreviewWithdraw(const Amount& assets) const { return ConvertToShares(assets, Rounding::Up); }
		// assets received for the redeemed shares
		Amount PreviewRedeem(const Amount& shares) const { return ConvertToAssets(shares, Rounding::Down); }

		const Amount& get_TotalAssets() const { return m_TotalAssets; }
		const Amount& get_TotalSupply() const { return m_TotalSupply; }

	private:
		static Amount MulDivStrict(const Amount& x, const Amount& y, const Amount& d, Rounding);

		Amount m_TotalAssets;
		Amount m_TotalSupply;
	};

} // namespace wtoken::vault
