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

#include "vault/permit.h"
#include "utility/logger.h"
#include "mock_asset.h"
#include "test_helpers.h"

WTOKEN_TEST_INIT

using namespace wtoken;
using namespace wtoken::vault;
using namespace wtoken::vault::test;

namespace
{
    const char g_szName[] = "Wrapped OpenEden Protocol USD";
    const Address g_Contract = MakeAddress(0xc0ffee);
    const Address g_Spender = MakeAddress(0x5e11de2);

    struct Signer
    {
        Hash m_Secret;
        Address m_Address;

        explicit Signer(uint32_t n)
        {
            m_Secret = n;
            WTOKEN_CHECK(Eth::AddressFromSecret(m_Address, m_Secret));
        }

        Eth::Signature SignPermit(const PermitAuthority& pa, const Address& owner, const Address& spender, const Amount& value, const Amount& nonce, const Eth::Word& deadline) const
        {
            PermitRequest req;
            req.m_Owner = owner;
            req.m_Spender = spender;
            req.m_Value = value;
            req.m_Nonce = nonce;
            req.m_Deadline = deadline;

            Hash digest = Eip712::get_Digest(pa.get_DomainSeparator(), req.get_StructHash());

            Eth::Signature sig;
            WTOKEN_CHECK(Eth::Sign(sig, digest, m_Secret));
            return sig;
        }
    };

    void TestTypeHashes()
    {
        std::cout << "\nTesting typed data hashes...\n";

        Hash hv;
        WTOKEN_CHECK(hv.Scan("8b73c3c69bb8fe3d512ecc4cf759cc79239f7b179b0ffacaa9a75d522b39400f"));
        WTOKEN_CHECK(Eip712::Domain::get_TypeHash() == hv);

        WTOKEN_CHECK(hv.Scan("6e71edae12b1b97f4d1f60370fef10105fa2faae0126114a169c64845d6126c9"));
        WTOKEN_CHECK(PermitRequest::get_TypeHash() == hv);

        Eip712::Domain d;
        d.m_Name = "Ether Mail";
        d.m_ChainID = 1;
        WTOKEN_CHECK(Eth::FromString(d.m_VerifyingContract, "0xCcCCccccCCCCcCCCCCCcCcCccCcCCCcCcccccccC"));
        WTOKEN_CHECK(hv.Scan("f2cee375fa42b42143804025fc449deafd50cc031ca257e0b194a650a912090f"));
        WTOKEN_CHECK(d.get_Separator() == hv);
    }

    void TestDomainSeparator()
    {
        std::cout << "\nTesting domain separator...\n";

        BlockContext ctx;
        PermitAuthority pa(g_szName, g_Contract, ctx);

        Eth::AbiHash hp;
        hp
            << Eth::HashOf("EIP712Domain(string name,string version,uint256 chainId,address verifyingContract)")
            << Eth::HashOf(g_szName)
            << Eth::HashOf("1")
            << ctx.m_ChainID
            << g_Contract;

        Hash hvExpected;
        hp >> hvExpected;
        WTOKEN_CHECK(pa.get_DomainSeparator() == hvExpected);

        // follows the chain id
        ctx.m_ChainID = 1;
        WTOKEN_CHECK(pa.get_DomainSeparator() != hvExpected);
        WTOKEN_CHECK(pa.get_Domain().m_ChainID == 1);
    }

    void TestPermits()
    {
        std::cout << "\nTesting permits...\n";

        BlockContext ctx;
        PermitAuthority pa(g_szName, g_Contract, ctx);

        Signer owner(1), other(2);
        Amount value = 100U;
        Eth::Word deadline = Eth::Word::get_Max();

        WTOKEN_CHECK(pa.get_Nonce(owner.m_Address) == Zero);

        Eth::Signature sig = owner.SignPermit(pa, owner.m_Address, g_Spender, value, pa.get_Nonce(owner.m_Address), deadline);
        WTOKEN_CHECK_NO_THROW(pa.Verify(owner.m_Address, g_Spender, value, deadline, sig));

        // verification alone doesn't consume the nonce
        WTOKEN_CHECK(pa.get_Nonce(owner.m_Address) == Zero);
        WTOKEN_CHECK(pa.UseNonce(owner.m_Address) == Zero);
        WTOKEN_CHECK(pa.get_Nonce(owner.m_Address) == Amount(1U));
        WTOKEN_CHECK(pa.get_Nonce(other.m_Address) == Zero);

        // replay
        try
        {
            pa.Verify(owner.m_Address, g_Spender, value, deadline, sig);
            WTOKEN_CHECK(!"must throw");
        }
        catch (const InvalidSignatureException& ex)
        {
            WTOKEN_CHECK(ex.m_Owner == owner.m_Address);
            WTOKEN_CHECK(ex.m_Spender == g_Spender);
        }

        // signed by someone else
        sig = other.SignPermit(pa, owner.m_Address, g_Spender, value, pa.get_Nonce(owner.m_Address), deadline);
        WTOKEN_CHECK_THROW_TYPE(pa.Verify(owner.m_Address, g_Spender, value, deadline, sig), InvalidSignature);

        // altered value
        sig = owner.SignPermit(pa, owner.m_Address, g_Spender, value, pa.get_Nonce(owner.m_Address), deadline);
        WTOKEN_CHECK_THROW_TYPE(pa.Verify(owner.m_Address, g_Spender, Amount(101U), deadline, sig), InvalidSignature);
        WTOKEN_CHECK_NO_THROW(pa.Verify(owner.m_Address, g_Spender, value, deadline, sig));

        // malleable twin of a valid signature
        Hash n;
        WTOKEN_CHECK(n.Scan("fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141"));
        Eth::Signature sig2 = sig;
        sig2.m_S.Negate();
        sig2.m_S += n;
        sig2.m_V ^= 1;
        WTOKEN_CHECK_THROW_TYPE(pa.Verify(owner.m_Address, g_Spender, value, deadline, sig2), InvalidSignature);

        // wrong chain
        ctx.m_ChainID++;
        WTOKEN_CHECK_THROW_TYPE(pa.Verify(owner.m_Address, g_Spender, value, deadline, sig), InvalidSignature);
    }

    void TestDeadline()
    {
        std::cout << "\nTesting permit deadline...\n";

        BlockContext ctx;
        PermitAuthority pa(g_szName, g_Contract, ctx);
        Signer owner(7);

        Amount value = 100U;
        Eth::Word deadline = ctx.m_Now;

        Eth::Signature sig = owner.SignPermit(pa, owner.m_Address, g_Spender, value, Zero, deadline);

        // the deadline itself is still valid
        WTOKEN_CHECK_NO_THROW(pa.Verify(owner.m_Address, g_Spender, value, deadline, sig));

        ctx.m_Now += 3601;
        try
        {
            pa.Verify(owner.m_Address, g_Spender, value, deadline, sig);
            WTOKEN_CHECK(!"must throw");
        }
        catch (const ExpiredDeadlineException& ex)
        {
            WTOKEN_CHECK(ex.m_Deadline == deadline);
            WTOKEN_CHECK(ex.m_Now == ctx.m_Now);
        }

        // expiration is reported before the signature is looked at
        Eth::Signature sigBad;
        WTOKEN_CHECK_THROW_TYPE(pa.Verify(owner.m_Address, g_Spender, value, deadline, sigBad), ExpiredDeadline);
    }

    // Recovery is pluggable, e.g. for a hardware or precompiled backend
    struct FixedRecovery
        :public ISignerRecovery
    {
        Address m_Signer = Zero;
        mutable uint32_t m_Calls = 0;

        bool RecoverSigner(Address& addr, const Hash&, const Eth::Signature&) const override
        {
            m_Calls++;
            if (m_Signer == Zero)
                return false;
            addr = m_Signer;
            return true;
        }
    };

    void TestCustomRecovery()
    {
        std::cout << "\nTesting custom signer recovery...\n";

        BlockContext ctx;
        auto pRecovery = std::make_shared<FixedRecovery>();
        PermitAuthority pa(g_szName, g_Contract, ctx, pRecovery);

        Address owner = MakeAddress(0x0123);
        Eth::Signature sig;

        WTOKEN_CHECK_THROW_TYPE(pa.Verify(owner, g_Spender, Zero, Eth::Word::get_Max(), sig), InvalidSignature);

        pRecovery->m_Signer = owner;
        WTOKEN_CHECK_NO_THROW(pa.Verify(owner, g_Spender, Zero, Eth::Word::get_Max(), sig));
        WTOKEN_CHECK(pRecovery->m_Calls == 2);
    }
}

int main()
{
    const auto logLevel = LOG_LEVEL_WARNING;
    const auto logger = wtoken::Logger::create(logLevel, logLevel);

    TestTypeHashes();
    TestDomainSeparator();
    TestPermits();
    TestDeadline();
    TestCustomRecovery();

    return WTOKEN_CHECK_RESULT;
}
