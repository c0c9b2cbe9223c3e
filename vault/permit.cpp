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

#include "permit.h"
#include "utility/logger.h"

namespace wtoken::vault
{
	bool Secp256k1Recovery::RecoverSigner(Address& addr, const Hash& digest, const Eth::Signature& sig) const
	{
		return Eth::ExtractSigner(addr, digest, sig);
	}

	const Hash& Eip712::Domain::get_TypeHash()
	{
		static const Hash s_hv = Eth::HashOf("EIP712Domain(string name,string version,uint256 chainId,address verifyingContract)");
		return s_hv;
	}

	Hash Eip712::Domain::get_Separator() const
	{
		Eth::AbiHash hp;
		hp
			<< get_TypeHash()
			<< Eth::HashOf(m_Name)
			<< Eth::HashOf(m_Version)
			<< m_ChainID
			<< m_VerifyingContract;

		Hash hv;
		hp >> hv;
		return hv;
	}

	Hash Eip712::get_Digest(const Hash& domainSeparator, const Hash& structHash)
	{
		Keccak256 hp;
		hp
			<< uint8_t(0x19)
			<< uint8_t(0x01)
			<< domainSeparator
			<< structHash;

		Hash hv;
		hp >> hv;
		return hv;
	}

	const Hash& PermitRequest::get_TypeHash()
	{
		static const Hash s_hv = Eth::HashOf("Permit(address owner,address spender,uint256 value,uint256 nonce,uint256 deadline)");
		return s_hv;
	}

	Hash PermitRequest::get_StructHash() const
	{
		Eth::AbiHash hp;
		hp
			<< get_TypeHash()
			<< m_Owner
			<< m_Spender
			<< m_Value
			<< m_Nonce
			<< m_Deadline;

		Hash hv;
		hp >> hv;
		return hv;
	}

	PermitAuthority::PermitAuthority(const std::string& name, const Address& verifyingContract, const IBlockContext& ctx, ISignerRecovery::Ptr pRecovery)
		: m_Name(name)
		, m_VerifyingContract(verifyingContract)
		, m_Context(ctx)
		, m_pRecovery(std::move(pRecovery))
	{
		if (!m_pRecovery)
			m_pRecovery = std::make_shared<Secp256k1Recovery>();
	}

	Eip712::Domain PermitAuthority::get_Domain() const
	{
		Eip712::Domain d;
		d.m_Name = m_Name;
		d.m_ChainID = m_Context.get_ChainID();
		d.m_VerifyingContract = m_VerifyingContract;
		return d;
	}

	Hash PermitAuthority::get_DomainSeparator() const
	{
		// chain id is read every time, the separator follows a fork
		return get_Domain().get_Separator();
	}

	Amount PermitAuthority::get_Nonce(const Address& owner) const
	{
		auto it = m_Nonces.find(owner);
		return (m_Nonces.end() == it) ? Amount(Zero) : it->second;
	}

	void PermitAuthority::Verify(const Address& owner, const Address& spender, const Amount& value, const Eth::Word& deadline, const Eth::Signature& sig) const
	{
		Timestamp now = m_Context.get_Timestamp();
		if (deadline < Eth::Word(now))
		{
			LOG_WARNING() << "Permit of " << Eth::ToString(owner) << " expired at " << deadline.str_dec() << ", now " << now;
			throw ExpiredDeadlineException(deadline, now);
		}

		PermitRequest req;
		req.m_Owner = owner;
		req.m_Spender = spender;
		req.m_Value = value;
		req.m_Nonce = get_Nonce(owner);
		req.m_Deadline = deadline;

		Hash digest = Eip712::get_Digest(get_DomainSeparator(), req.get_StructHash());

		Address signer;
		if (!m_pRecovery->RecoverSigner(signer, digest, sig) || (signer != owner))
		{
			LOG_WARNING() << "Permit of " << Eth::ToString(owner) << " for " << Eth::ToString(spender) << " rejected, bad signature";
			throw InvalidSignatureException(owner, spender);
		}
	}

	Amount PermitAuthority::UseNonce(const Address& owner)
	{
		Amount ret = get_Nonce(owner);

		Amount one = 1U;
		Amount next = Strict::Sum(ret, one);

		m_Nonces.insert_or_assign(owner, next);
		return ret;
	}

} // namespace wtoken::vault
