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

#include "wtoken/commands.h"
#include "vault/permit.h"
#include "utility/logger.h"
#include "vault/unittests/mock_asset.h"
#include "vault/unittests/test_helpers.h"

#include <cstdio>
#include <fstream>
#include <sstream>

WTOKEN_TEST_INIT

using namespace wtoken;
using namespace wtoken::vault;
using namespace wtoken::vault::test;

namespace
{
    const char g_szEtherMail[] = "Ether Mail";
    const char g_szEtherMailContract[] = "0xCcCCccccCCCCcCCCCCCcCcCccCcCCCcCcccccccC";
    const char g_szEtherMailSeparator[] = "0xf2cee375fa42b42143804025fc449deafd50cc031ca257e0b194a650a912090f";

    const char g_szOwner[] = "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf"; // secret 1
    const char g_szSpender[] = "0x00000000000000000000000000000000005e11de";
    const char g_szVault[] = "0x000000000000000000000000000000000007a017";

    struct CommandLine
    {
        std::vector<std::string> m_Args;

        CommandLine(std::initializer_list<const char*> args)
        {
            m_Args.push_back("wtoken-cli");
            for (const char* sz : args)
                m_Args.push_back(sz);
        }

        po::variables_map Parse() const
        {
            std::vector<char*> argv;
            for (const auto& s : m_Args)
                argv.push_back(const_cast<char*>(s.c_str()));

            auto [options, visibleOptions] = createOptionsDescription(ALL_OPTIONS, "");
            return getOptions(static_cast<int>(argv.size()), &argv.front(), options);
        }

        // returns the printed output, empty if the command failed
        std::string Run() const
        {
            std::ostringstream os;
            if (RunCommand(Parse(), os))
                return std::string();
            return os.str();
        }
    };

    // value printed after the given label, e.g. "Digest:"
    std::string GetField(const std::string& sOutput, const char* szLabel)
    {
        std::istringstream is(sOutput);
        std::string sLine;
        const size_t nLabel = strlen(szLabel);

        while (std::getline(is, sLine))
        {
            if (sLine.compare(0, nLabel, szLabel))
                continue;

            size_t nPos = sLine.find_first_not_of(' ', nLabel);
            return (std::string::npos == nPos) ? std::string() : sLine.substr(nPos);
        }

        return std::string();
    }

    Address ParseAddress(const char* sz)
    {
        Address addr;
        WTOKEN_CHECK(Eth::FromString(addr, sz));
        return addr;
    }

    Hash GetDigest(const Eip712::Domain& d, const Amount& value, const Amount& nonce, const Eth::Word& deadline)
    {
        PermitRequest req;
        req.m_Owner = ParseAddress(g_szOwner);
        req.m_Spender = ParseAddress(g_szSpender);
        req.m_Value = value;
        req.m_Nonce = nonce;
        req.m_Deadline = deadline;

        return Eip712::get_Digest(d.get_Separator(), req.get_StructHash());
    }

    Eip712::Domain MakeDomain(const char* szName, uint64_t nChainID, const char* szContract)
    {
        Eip712::Domain d;
        d.m_Name = szName;
        d.m_ChainID = nChainID;
        d.m_VerifyingContract = ParseAddress(szContract);
        return d;
    }

    void TestDomain()
    {
        std::cout << "\nTesting domain command...\n";

        std::string sOut = CommandLine({ "domain", "--name", g_szEtherMail, "--chain_id", "1", "--contract", g_szEtherMailContract }).Run();
        WTOKEN_CHECK(GetField(sOut, "DOMAIN_SEPARATOR:") == g_szEtherMailSeparator);

        // the separator the token itself uses for permits
        BlockContext ctx;
        PermitAuthority pa("Wrapped OpenEden Protocol USD", ParseAddress(g_szVault), ctx);

        sOut = CommandLine({ "domain", "--chain_id", "31337", "--contract", g_szVault }).Run();
        WTOKEN_CHECK(GetField(sOut, "DOMAIN_SEPARATOR:") == Eth::ToString(pa.get_DomainSeparator()));

        // contract is mandatory
        WTOKEN_CHECK_THROW(CommandLine({ "domain", "--chain_id", "1" }).Run());
        WTOKEN_CHECK_THROW(CommandLine({ "domain", "--contract", "0xnot-an-address" }).Run());
    }

    void TestPermitDigest()
    {
        std::cout << "\nTesting permit_digest command...\n";

        Eip712::Domain d = MakeDomain(g_szEtherMail, 1, g_szEtherMailContract);
        const Eth::Word noDeadline = Eth::Word::get_Max();

        std::string sUnits = CommandLine({ "permit_digest", "--name", g_szEtherMail, "--contract", g_szEtherMailContract,
            "--owner", g_szOwner, "--spender", g_szSpender, "--value", "100" }).Run();

        WTOKEN_CHECK(GetField(sUnits, "DOMAIN_SEPARATOR:") == g_szEtherMailSeparator);
        // no deadline means the permit never expires
        WTOKEN_CHECK(GetField(sUnits, "Digest:") == Eth::ToString(GetDigest(d, Units("100"), Zero, noDeadline)));

        // the same value in base units
        std::string sWei = CommandLine({ "permit_digest", "--wei", "--name", g_szEtherMail, "--contract", g_szEtherMailContract,
            "--owner", g_szOwner, "--spender", g_szSpender, "--value", "100" }).Run();

        WTOKEN_CHECK(GetField(sWei, "Digest:") == Eth::ToString(GetDigest(d, Wei("100"), Zero, noDeadline)));
        WTOKEN_CHECK(GetField(sWei, "Digest:") != GetField(sUnits, "Digest:"));

        std::string sMax = CommandLine({ "permit_digest", "--name", g_szEtherMail, "--contract", g_szEtherMailContract,
            "--owner", g_szOwner, "--spender", g_szSpender, "--value", "max", "--nonce", "3", "--deadline", "1700000000" }).Run();

        Eth::Word deadline = 1700000000U;
        WTOKEN_CHECK(GetField(sMax, "Digest:") == Eth::ToString(GetDigest(d, Amount::get_Max(), Amount(3U), deadline)));

        WTOKEN_CHECK_THROW(CommandLine({ "permit_digest", "--contract", g_szEtherMailContract,
            "--owner", g_szOwner, "--spender", g_szSpender, "--value", "1.2.3" }).Run());
        WTOKEN_CHECK_THROW(CommandLine({ "permit_digest", "--contract", g_szEtherMailContract,
            "--owner", g_szOwner, "--value", "1" }).Run());
    }

    void TestSignPermit()
    {
        std::cout << "\nTesting sign_permit command...\n";

        const std::string sSecret = std::string(63, '0') + "1";

        std::string sOut = CommandLine({ "sign_permit", "--chain_id", "31337", "--contract", g_szVault,
            "--owner", g_szOwner, "--spender", g_szSpender, "--value", "25", "--secret", sSecret.c_str() }).Run();

        WTOKEN_CHECK(GetField(sOut, "Signer:") == g_szOwner);

        Eth::Signature sig;
        std::string sV = GetField(sOut, "v:");
        WTOKEN_CHECK(!sV.empty());
        if (!sV.empty())
            sig.m_V = static_cast<uint8_t>(std::stoul(sV));
        WTOKEN_CHECK(sig.m_R.Scan(GetField(sOut, "r:")));
        WTOKEN_CHECK(sig.m_S.Scan(GetField(sOut, "s:")));

        // accepted by the token
        BlockContext ctx;
        PermitAuthority pa("Wrapped OpenEden Protocol USD", ParseAddress(g_szVault), ctx);
        WTOKEN_CHECK_NO_THROW(pa.Verify(ParseAddress(g_szOwner), ParseAddress(g_szSpender), Units("25"), Eth::Word::get_Max(), sig));

        // malformed key
        WTOKEN_CHECK(CommandLine({ "sign_permit", "--contract", g_szVault,
            "--owner", g_szOwner, "--spender", g_szSpender, "--value", "25", "--secret", "xyz" }).Run().empty());
    }

    void TestPreview()
    {
        std::cout << "\nTesting preview command...\n";

        // 110 assets backing 100 shares, all in base units
        std::string sOut = CommandLine({ "preview", "--wei", "--amount", "11", "--total_assets", "110", "--total_supply", "100" }).Run();

        WTOKEN_CHECK(GetField(sOut, "convertToShares:") == "10");
        WTOKEN_CHECK(GetField(sOut, "convertToAssets:") == "12");
        WTOKEN_CHECK(GetField(sOut, "previewDeposit:") == "10");
        WTOKEN_CHECK(GetField(sOut, "previewMint:") == "13");
        WTOKEN_CHECK(GetField(sOut, "previewWithdraw:") == "11");
        WTOKEN_CHECK(GetField(sOut, "previewRedeem:") == "12");

        // empty vault, token units
        sOut = CommandLine({ "preview", "--amount", "1337.5" }).Run();
        WTOKEN_CHECK(GetField(sOut, "previewDeposit:") == "1337.5");
        WTOKEN_CHECK(GetField(sOut, "previewRedeem:") == "1337.5");

        // a switch takes no value
        WTOKEN_CHECK_THROW(CommandLine({ "preview", "--wei", "1", "--amount", "1" }).Parse());
    }

    void TestConfigFile()
    {
        std::cout << "\nTesting config file...\n";

        const char szPath[] = "wtoken_cli_test.cfg";
        {
            std::ofstream f(szPath);
            f << "name=" << g_szEtherMail << "\n"
                << "contract=" << g_szEtherMailContract << "\n"
                << "chain_id=5\n";
        }

        // the file supplies what's missing, the command line wins
        std::string sOut = CommandLine({ "domain", "--chain_id", "1", "--config_file", szPath }).Run();
        WTOKEN_CHECK(GetField(sOut, "DOMAIN_SEPARATOR:") == g_szEtherMailSeparator);

        sOut = CommandLine({ "domain", "--config_file", szPath }).Run();
        WTOKEN_CHECK(GetField(sOut, "DOMAIN_SEPARATOR:") == Eth::ToString(MakeDomain(g_szEtherMail, 5, g_szEtherMailContract).get_Separator()));

        WTOKEN_CHECK(!std::remove(szPath));
    }

    void TestCommands()
    {
        std::cout << "\nTesting command dispatch...\n";

        std::ostringstream os;
        WTOKEN_CHECK(RunCommand(CommandLine({ "unknown" }).Parse(), os) != 0);
        WTOKEN_CHECK(RunCommand(CommandLine({ "--chain_id", "1" }).Parse(), os) != 0);
        WTOKEN_CHECK(os.str().empty());

        WTOKEN_CHECK(CommandLine({ "--command", "domain", "--contract", g_szEtherMailContract, "--name", g_szEtherMail }).Run().find(g_szEtherMailSeparator) != std::string::npos);
    }
}

int main()
{
    const auto logLevel = LOG_LEVEL_WARNING;
    const auto logger = wtoken::Logger::create(logLevel, logLevel);

    try
    {
        TestDomain();
        TestPermitDigest();
        TestSignPermit();
        TestPreview();
        TestConfigFile();
        TestCommands();
    }
    catch (const std::exception& ex)
    {
        std::cout << "unexpected exception: " << ex.what() << "\n";
        return 1;
    }

    return WTOKEN_CHECK_RESULT;
}
