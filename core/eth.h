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
#include "keccak.h"

namespace wtoken {
namespace Eth
{
	typedef uintBig_t<20> Address;
	typedef uintBig_t<32> Hash;
	typedef uintBig_t<32> Word; // uint256 as seen by the ABI

	Hash HashOf(const Blob&);

	inline Hash HashOf(const char* sz)
	{
		return HashOf(Blob(sz, static_cast<uint32_t>(strlen(sz))));
	}

	std::string ToString(const Address&); // 0x-prefixed, lowercase
	std::string ToString(const Hash&);
	bool FromString(Address&, const std::string&);

	// Streams statically-typed values into keccak in ABI encoding, each one padded to a 32-byte word.
	// Equivalent to keccak256(abi.encode(...))
	struct AbiHash
	{
		Keccak256 m_Hp;

		AbiHash& operator << (const Word&);
		AbiHash& operator << (const Address&);
		AbiHash& operator << (uint64_t);

		void operator >> (Hash& hv) { m_Hp >> hv; }
	};

	// Recoverable secp256k1 signature in the Ethereum {v, r, s} form, v is 27 or 28
	struct Signature
	{
		uint8_t m_V = 0;
		Hash m_R = Zero;
		Hash m_S = Zero;

		// v in range, r and s non-zero, s in the lower half of the curve order
		bool IsWellFormed() const;
	};

	// Recovers the address that signed the digest. Fails for malformed signatures and unrecoverable points
	bool ExtractSigner(Address&, const Hash& digest, const Signature&);

	// Deterministic (RFC6979) low-s signature
	bool Sign(Signature&, const Hash& digest, const Hash& secret);

	bool AddressFromSecret(Address&, const Hash& secret);

} // namespace Eth
} // namespace wtoken
