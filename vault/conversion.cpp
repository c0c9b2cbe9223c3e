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

#include "conversion.h"

namespace wtoken::vault
{
	ConversionEngine::ConversionEngine(const Amount& totalAssets, const Amount& totalSupply)
		: m_TotalAssets(totalAssets)
		, m_TotalSupply(totalSupply)
	{
	}

	Amount ConversionEngine::MulDivStrict(const Amount& x, const Amount& y, const Amount& d, Rounding r)
	{
		Amount res;
		if (!MulDiv(res, x, y, d, Rounding::Up == r))
			throw VaultException("conversion overflow", VaultException::Type::Overflow);
		return res;
	}

	Amount ConversionEngine::ConvertToShares(const Amount& assets, Rounding r) const
	{
		if ((m_TotalSupply == Zero) || (m_TotalAssets == Zero))
			return assets;

		Amount one = 1U;
		return MulDivStrict(assets, Strict::Sum(m_TotalSupply, one), Strict::Sum(m_TotalAssets, one), r);
	}

	Amount ConversionEngine::ConvertToAssets(const Amount& shares, Rounding r) const
	{
		if (m_TotalSupply == Zero)
			return shares;

		Amount one = 1U;
		return MulDivStrict(shares, Strict::Sum(m_TotalAssets, one), Strict::Sum(m_TotalSupply, one), r);
	}

} // namespace wtoken::vault
