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
#include "vault/permit.h"
#include "vault/conversion.h"
#include "utility/logger.h"

using namespace std;
using namespace wtoken::vault;

namespace wtoken
{
	namespace
	{
		const string& GetRequired(const po::variables_map& vm, const char* szName)
		{
			if (!vm.count(szName))
				throw std::runtime_error(string("option '--") + szName + "' is required");
			return vm[szName].as<string>();
		}

		Address GetAddress(const po::variables_map& vm, const char* szName)
		{
			const string& s = GetRequired(vm, szName);

			Address addr;
			if (!Eth::FromString(addr, s))
				throw std::runtime_error(string("invalid address for '--") + szName + "': " + s);
			return addr;
		}

		bool IsWei(const po::variables_map& vm)
		{
			return vm.count(cli::WEI) && vm[cli::WEI].as<bool>();
		}

		Amount GetAmount(const po::variables_map& vm, const char* szName)
		{
			const string& s = GetRequired(vm, szName);
			if ("max" == s)
				return Amount::get_Max();

			Amount x;
			if (!x.ScanDecimal(s.c_str(), IsWei(vm) ? 0 : s_Decimals))
				throw std::runtime_error(string("invalid amount for '--") + szName + "': " + s);
			return x;
		}

		string PrintAmount(const po::variables_map& vm, const Amount& x)
		{
			return x.str_dec(IsWei(vm) ? 0 : s_Decimals);
		}

		Eip712::Domain GetDomain(const po::variables_map& vm)
		{
			Eip712::Domain d;
			d.m_Name = vm[cli::NAME].as<string>();
			d.m_ChainID = vm[cli::CHAIN_ID].as<uint64_t>();
			d.m_VerifyingContract = GetAddress(vm, cli::CONTRACT);
			return d;
		}

		PermitRequest GetPermit(const po::variables_map& vm)
		{
			PermitRequest req;
			req.m_Owner = GetAddress(vm, cli::OWNER);
			req.m_Spender = GetAddress(vm, cli::SPENDER);
			req.m_Value = GetAmount(vm, cli::VALUE);
			req.m_Nonce = vm[cli::NONCE].as<uint64_t>();

			if (vm.count(cli::DEADLINE))
				req.m_Deadline = vm[cli::DEADLINE].as<uint64_t>();
			else
				req.m_Deadline = Eth::Word::get_Max();

			return req;
		}

		Hash PrintDigest(const po::variables_map& vm, const PermitRequest& req, ostream& os)
		{
			Hash hvDomain = GetDomain(vm).get_Separator();
			Hash hvStruct = req.get_StructHash();
			Hash hvDigest = Eip712::get_Digest(hvDomain, hvStruct);

			os
				<< "DOMAIN_SEPARATOR: " << Eth::ToString(hvDomain) << '\n'
				<< "Struct hash:      " << Eth::ToString(hvStruct) << '\n'
				<< "Digest:           " << Eth::ToString(hvDigest) << endl;

			return hvDigest;
		}

		int DoDomain(const po::variables_map& vm, ostream& os)
		{
			Eip712::Domain d = GetDomain(vm);
			LOG_DEBUG() << "Domain: " << d.m_Name << ", version " << d.m_Version << ", chain " << d.m_ChainID << ", contract " << Eth::ToString(d.m_VerifyingContract);

			os << "DOMAIN_SEPARATOR: " << Eth::ToString(d.get_Separator()) << endl;
			return 0;
		}

		int DoPermitDigest(const po::variables_map& vm, ostream& os)
		{
			PrintDigest(vm, GetPermit(vm), os);
			return 0;
		}

		int DoSignPermit(const po::variables_map& vm, ostream& os)
		{
			PermitRequest req = GetPermit(vm);

			string sSecret;
			if (vm.count(cli::SECRET))
				sSecret = vm[cli::SECRET].as<string>();
			else
				read_secret("Enter secret key: ", sSecret);

			Hash secret;
			if (!secret.Scan(sSecret))
			{
				LOG_ERROR() << "Invalid secret key";
				return -1;
			}

			Address addrSigner;
			if (!Eth::AddressFromSecret(addrSigner, secret))
			{
				LOG_ERROR() << "Secret key is out of range";
				return -1;
			}

			if (addrSigner != req.m_Owner)
				LOG_WARNING() << "Signer " << Eth::ToString(addrSigner) << " is not the owner " << Eth::ToString(req.m_Owner) << ", the permit will be rejected";

			Hash hvDigest = PrintDigest(vm, req, os);

			Eth::Signature sig;
			if (!Eth::Sign(sig, hvDigest, secret))
			{
				LOG_ERROR() << "Signing failed";
				return -1;
			}

			os
				<< "Signer: " << Eth::ToString(addrSigner) << '\n'
				<< "v: " << static_cast<uint32_t>(sig.m_V) << '\n'
				<< "r: " << Eth::ToString(sig.m_R) << '\n'
				<< "s: " << Eth::ToString(sig.m_S) << endl;

			return 0;
		}

		int DoPreview(const po::variables_map& vm, ostream& os)
		{
			Amount amount = GetAmount(vm, cli::AMOUNT);
			ConversionEngine ce(GetAmount(vm, cli::TOTAL_ASSETS), GetAmount(vm, cli::TOTAL_SUPPLY));

			os
				<< "convertToShares: " << PrintAmount(vm, ce.ConvertToShares(amount)) << '\n'
				<< "convertToAssets: " << PrintAmount(vm, ce.ConvertToAssets(amount)) << '\n'
				<< "previewDeposit:  " << PrintAmount(vm, ce.PreviewDeposit(amount)) << '\n'
				<< "previewMint:     " << PrintAmount(vm, ce.PreviewMint(amount)) << '\n'
				<< "previewWithdraw: " << PrintAmount(vm, ce.PreviewWithdraw(amount)) << '\n'
				<< "previewRedeem:   " << PrintAmount(vm, ce.PreviewRedeem(amount)) << endl;

			return 0;
		}

		typedef int (*CommandFunc)(const po::variables_map&, ostream&);

		struct Command
		{
			const char* m_szName;
			CommandFunc m_pFunc;
		};

		const Command g_Commands[] = {
			{ cli::CMD_DOMAIN, DoDomain },
			{ cli::CMD_PERMIT_DIGEST, DoPermitDigest },
			{ cli::CMD_SIGN_PERMIT, DoSignPermit },
			{ cli::CMD_PREVIEW, DoPreview },
		};

		const Command* FindCommand(const string& sName)
		{
			for (const auto& cmd : g_Commands)
			{
				if (sName == cmd.m_szName)
					return &cmd;
			}
			return nullptr;
		}
	}

	int RunCommand(const po::variables_map& vm, ostream& os)
	{
		if (!vm.count(cli::COMMAND))
		{
			LOG_ERROR() << "Command is not specified";
			return -1;
		}

		const string& sCommand = vm[cli::COMMAND].as<string>();
		const Command* pCmd = FindCommand(sCommand);
		if (!pCmd)
		{
			LOG_ERROR() << "Unknown command: '" << sCommand << "'";
			return -1;
		}

		return pCmd->m_pFunc(vm, os);
	}
}
