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

#include "vault/conversion.h"
#include "utility/logger.h"
#include "mock_asset.h"
#include "test_helpers.h"

WTOKEN_TEST_INIT

using namespace wtoken;
using namespace wtoken::vault;
using namespace wtoken::vault::test;

namespace
{
    void TestEmptyVault()
    {
        std::cout << "\nTesting empty vault conversions...\n";

        ConversionEngine ce(Zero, Zero);
        Amount x = Units("1337");

        WTOKEN_CHECK(ce.ConvertToShares(x) == x);
        WTOKEN_CHECK(ce.ConvertToAssets(x) == x);
        WTOKEN_CHECK(ce.PreviewDeposit(x) == x);
        WTOKEN_CHECK(ce.PreviewMint(x) == x);
        WTOKEN_CHECK(ce.PreviewWithdraw(x) == x);
        WTOKEN_CHECK(ce.PreviewRedeem(x) == x);

        Amount big = Amount::get_Max();
        WTOKEN_CHECK(ce.ConvertToShares(big) == big);
    }

    void TestNoAssets()
    {
        std::cout << "\nTesting conversions with shares and no assets...\n";

        // e.g. everything was drained on the asset side
        ConversionEngine ce(Zero, Wei("100"));

        WTOKEN_CHECK(ce.ConvertToShares(Wei("50")) == Wei("50"));
        WTOKEN_CHECK(ce.ConvertToAssets(Wei("50")) == Zero);
        WTOKEN_CHECK(ce.ConvertToAssets(Wei("100"), Rounding::Up) == Wei("1"));
    }

    void TestRounding()
    {
        std::cout << "\nTesting rounding directions...\n";

        // 110 assets backing 100 shares
        ConversionEngine ce(Wei("110"), Wei("100"));

        // 11 * 101 / 111 = 10.009
        WTOKEN_CHECK(ce.ConvertToShares(Wei("11")) == Wei("10"));
        WTOKEN_CHECK(ce.ConvertToShares(Wei("11"), Rounding::Up) == Wei("11"));

        // 10 * 111 / 101 = 10.99
        WTOKEN_CHECK(ce.ConvertToAssets(Wei("10")) == Wei("10"));
        WTOKEN_CHECK(ce.ConvertToAssets(Wei("10"), Rounding::Up) == Wei("11"));

        // deposit and redeem give less, mint and withdraw cost more
        WTOKEN_CHECK(ce.PreviewDeposit(Wei("11")) == Wei("10"));
        WTOKEN_CHECK(ce.PreviewRedeem(Wei("10")) == Wei("10"));
        WTOKEN_CHECK(ce.PreviewMint(Wei("10")) == Wei("11"));
        WTOKEN_CHECK(ce.PreviewWithdraw(Wei("11")) == Wei("11"));

        // exact ratio, both directions agree
        ConversionEngine ce2(Wei("201"), Wei("100"));
        WTOKEN_CHECK(ce2.ConvertToAssets(Wei("101"), Rounding::Down) == Wei("202"));
        WTOKEN_CHECK(ce2.ConvertToAssets(Wei("101"), Rounding::Up) == Wei("202"));
    }

    void TestVaultFavoring()
    {
        std::cout << "\nTesting round trips never favor the user...\n";

        const char* pTotals[][2] = {
            { "1337133700000000000000", "1337000000000000000000" },
            { "1100000000000000000", "1000000000000000000" },
            { "3", "7" },
            { "1000000000000000000000000", "1" },
            { "1", "1000000000000000000000000" },
        };

        const char* pAmounts[] = { "1", "2", "999", "1000000000000000000", "123456789012345678901" };

        for (size_t i = 0; i < _countof(pTotals); i++)
        {
            ConversionEngine ce(Wei(pTotals[i][0]), Wei(pTotals[i][1]));

            for (size_t j = 0; j < _countof(pAmounts); j++)
            {
                Amount a = Wei(pAmounts[j]);

                // deposit then redeem
                Amount s = ce.PreviewDeposit(a);
                WTOKEN_CHECK(ce.PreviewRedeem(s) <= a);

                // mint then redeem
                WTOKEN_CHECK(ce.PreviewRedeem(a) <= ce.PreviewMint(a));

                // withdraw burns at least what deposit would have minted
                WTOKEN_CHECK(ce.PreviewWithdraw(a) >= ce.PreviewDeposit(a));
            }
        }
    }

    void TestOverflow()
    {
        std::cout << "\nTesting conversion overflow...\n";

        Amount big = Amount::get_Max();

        {
            ConversionEngine ce(big, Wei("1"));
            WTOKEN_CHECK_THROW_TYPE(ce.ConvertToShares(Wei("1")), Overflow); // totalAssets + 1
        }
        {
            ConversionEngine ce(Wei("1000"), Wei("1"));
            WTOKEN_CHECK_THROW_TYPE(ce.ConvertToAssets(big), Overflow);
            WTOKEN_CHECK_NO_THROW(ce.ConvertToShares(big));
        }
    }
}

int main()
{
    const auto logLevel = LOG_LEVEL_WARNING;
    const auto logger = wtoken::Logger::create(logLevel, logLevel);

    TestEmptyVault();
    TestNoAssets();
    TestRounding();
    TestVaultFavoring();
    TestOverflow();

    return WTOKEN_CHECK_RESULT;
}
