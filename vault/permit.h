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
	struct ISignerRecovery
	{
		typedef std::shared_ptr<ISignerRecovery> Ptr;

		virtual ~ISignerRecovery() {}
		// false if the signature is malformed or the signer can't be recovered
		virtual bool RecoverSigner(Address&, const Hash& digest, const Eth::Signature&) const = 0;
	};

	struct Secp256k1Recovery
		:public ISignerRecovery
	{
		bool RecoverSigner(Address&, const Hash& digest, const Eth::Signature&) const override;
	};

	// Typed structured data hashing (EIP-712)
	struct Eip712
	{
		struct Domain
		{
			std::string m_Name;
			std::string m_Version = "1";
			uint64_t m_ChainID = 0;
			Address m_VerifyingContract = Zero;

			static const Hash& get_TypeHash();
			Hash get_Separator() const;
		};

		// keccak256(0x19 0x01 || domainSeparator || structHash)
		static Hash get_Digest(const Hash& domainSeparator, const Hash& structHash);
	};

	struct PermitRequest
	{
		Address m_Owner = Zero;
		Address m_Spender = Zero;
		Amount m_Value = Zero;
		Amount m_Nonce = Zero;
		Eth::Word m_Deadline = Zero;

		static const Hash& get_TypeHash();
		Hash get_StructHash() const;
	};

	// Signed approvals: per-owner nonces, domain separation, deadline and signer checks
	class PermitAuthority
	{
	public:
		PermitAuthority(const std::string& name, const Address& verifyingContract, const IBlockContext&, ISignerRecovery::Ptr = nullptr);

		Eip712::Domain get_Domain() const;
		Hash get_DomainSeparator() const;

		Amount get_Nonce(const Address& owner) const;

		// Checks the approval signed by the owner over its current nonce. Throws ExpiredDeadlineException or InvalidSignatureException
		void Verify(const Address& owner, const Address& spender, const Amount& value, const Eth::Word& deadline, const Eth::Signature&) const;

		// Marks the current nonce of the owner as used. Returns the used value
		Amount UseNonce(const Address& owner);

	private:
		std::string m_Name;
		Address m_VerifyingContract;
		const IBlockContext& m_Context;
		ISignerRecovery::Ptr m_pRecovery;
		std::map<Address, Amount> m_Nonces;
	};

} // namespace wtoken::vault
