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

#include "eth.h"
#include <secp256k1.h>
#include <secp256k1_recovery.h>

namespace wtoken {
namespace Eth
{
	namespace
	{
		struct Context
		{
			secp256k1_context* m_p;

			Context()
			{
				m_p = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
				if (!m_p)
					throw std::runtime_error("secp256k1 context creation failed");
			}

			~Context()
			{
				secp256k1_context_destroy(m_p);
			}

			static const secp256k1_context* get()
			{
				static Context s_Ctx;
				return s_Ctx.m_p;
			}
		};

		// secp256k1 order / 2
		const Hash s_HalfOrder = {
			0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
			0x5d, 0x57, 0x6e, 0x73, 0x57, 0xa4, 0x50, 0x1d, 0xdf, 0xe9, 0x2f, 0x46, 0x68, 0x1b, 0x20, 0xa0
		};

		const uint8_t s_V0 = 27;

		Address ToAddress(const secp256k1_pubkey& pk)
		{
			uint8_t pSer[65];
			size_t nSize = sizeof(pSer);
			secp256k1_ec_pubkey_serialize(Context::get(), pSer, &nSize, &pk, SECP256K1_EC_UNCOMPRESSED);

			// drop the 0x04 tag, the address is the tail of the hash
			Hash hv = HashOf(Blob(pSer + 1, static_cast<uint32_t>(nSize - 1)));

			Address addr;
			addr = hv;
			return addr;
		}
	}

	Hash HashOf(const Blob& x)
	{
		Keccak256 hp;
		hp << x;

		Hash hv;
		hp >> hv;
		return hv;
	}

	std::string ToString(const Address& x)
	{
		return "0x" + x.str();
	}

	std::string ToString(const Hash& x)
	{
		return "0x" + x.str();
	}

	bool FromString(Address& x, const std::string& s)
	{
		return x.Scan(s);
	}

	AbiHash& AbiHash::operator << (const Word& x)
	{
		m_Hp << x;
		return *this;
	}

	AbiHash& AbiHash::operator << (const Address& x)
	{
		Word w;
		w = x; // left-padded
		return operator << (w);
	}

	AbiHash& AbiHash::operator << (uint64_t x)
	{
		Word w = x;
		return operator << (w);
	}

	bool Signature::IsWellFormed() const
	{
		if ((m_V != s_V0) && (m_V != s_V0 + 1))
			return false;

		if ((m_R == Zero) || (m_S == Zero))
			return false;

		return m_S <= s_HalfOrder;
	}

	bool ExtractSigner(Address& addr, const Hash& digest, const Signature& sig)
	{
		if (!sig.IsWellFormed())
			return false;

		uint8_t pCompact[64];
		memcpy(pCompact, sig.m_R.m_pData, Hash::nBytes);
		memcpy(pCompact + Hash::nBytes, sig.m_S.m_pData, Hash::nBytes);

		const secp256k1_context* pCtx = Context::get();

		secp256k1_ecdsa_recoverable_signature rs;
		if (!secp256k1_ecdsa_recoverable_signature_parse_compact(pCtx, &rs, pCompact, sig.m_V - s_V0))
			return false; // r or s overflow the order

		secp256k1_pubkey pk;
		if (!secp256k1_ecdsa_recover(pCtx, &pk, &rs, digest.m_pData))
			return false;

		addr = ToAddress(pk);
		return true;
	}

	bool Sign(Signature& sig, const Hash& digest, const Hash& secret)
	{
		const secp256k1_context* pCtx = Context::get();

		secp256k1_ecdsa_recoverable_signature rs;
		if (!secp256k1_ecdsa_sign_recoverable(pCtx, &rs, digest.m_pData, secret.m_pData, nullptr, nullptr))
			return false;

		uint8_t pCompact[64];
		int nRecID = 0;
		secp256k1_ecdsa_recoverable_signature_serialize_compact(pCtx, pCompact, &nRecID, &rs);

		memcpy(sig.m_R.m_pData, pCompact, Hash::nBytes);
		memcpy(sig.m_S.m_pData, pCompact + Hash::nBytes, Hash::nBytes);
		sig.m_V = static_cast<uint8_t>(s_V0 + nRecID);
		return true;
	}

	bool AddressFromSecret(Address& addr, const Hash& secret)
	{
		secp256k1_pubkey pk;
		if (!secp256k1_ec_pubkey_create(Context::get(), &pk, secret.m_pData))
			return false;

		addr = ToAddress(pk);
		return true;
	}

} // namespace Eth
} // namespace wtoken
