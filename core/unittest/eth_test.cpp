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

#include <iostream>
#include "../eth.h"

int g_TestsFailed = 0;

void TestFailed(const char* szExpr, uint32_t nLine)
{
	printf("Test failed! Line=%u, Expression: %s\n", nLine, szExpr);
	g_TestsFailed++;
}

#define verify_test(x) \
	do { \
		if (!(x)) \
			TestFailed(#x, __LINE__); \
	} while (false)

namespace wtoken {
namespace Eth {

Hash HashFromHex(const char* sz)
{
	Hash hv;
	verify_test(hv.Scan(sz));
	return hv;
}

Address AddrFromHex(const char* sz)
{
	Address addr;
	verify_test(FromString(addr, sz));
	return addr;
}

void TestKeccak()
{
	std::cout << "TestKeccak" << std::endl;

	verify_test(HashOf("") == HashFromHex("c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470"));
	verify_test(HashOf("abc") == HashFromHex("4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45"));

	// incremental writes, across the block boundary (136 bytes for keccak256)
	std::string s(300, 'x');

	Keccak256 hp;
	hp.Write(s.data(), 100);
	hp.Write(s.data() + 100, 37);
	hp.Write(s.data() + 137, 163);

	Hash hv;
	hp >> hv;
	verify_test(hv == HashOf(s.c_str()));
}

void TestAddresses()
{
	std::cout << "TestAddresses" << std::endl;

	Address addr;
	Hash sk = 1U;
	verify_test(AddressFromSecret(addr, sk));
	verify_test(addr == AddrFromHex("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf"));
	verify_test(ToString(addr) == "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");

	sk = 2U;
	verify_test(AddressFromSecret(addr, sk));
	verify_test(addr == AddrFromHex("0x2B5AD5c4795c026514f8317c7a215E218DcCD6cF")); // checksummed form

	sk = Zero;
	verify_test(!AddressFromSecret(addr, sk));

	verify_test(!FromString(addr, "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf00")); // too long
	verify_test(!FromString(addr, "0xzz"));
}

void TestSignatures()
{
	std::cout << "TestSignatures" << std::endl;

	Hash sk = HashFromHex("4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318");
	Address addr;
	verify_test(AddressFromSecret(addr, sk));

	Hash digest = HashOf("message");

	Signature sig;
	verify_test(Sign(sig, digest, sk));
	verify_test(sig.IsWellFormed());

	Address signer;
	verify_test(ExtractSigner(signer, digest, sig));
	verify_test(signer == addr);

	// other digest recovers some other key
	verify_test(!ExtractSigner(signer, HashOf("other message"), sig) || (signer != addr));

	// the flipped recovery id gives the other point
	Signature sig2 = sig;
	sig2.m_V ^= 1;
	verify_test(!ExtractSigner(signer, digest, sig2) || (signer != addr));

	sig2 = sig;
	sig2.m_V = 0;
	verify_test(!sig2.IsWellFormed());
	verify_test(!ExtractSigner(signer, digest, sig2));

	sig2 = sig;
	sig2.m_R = Zero;
	verify_test(!ExtractSigner(signer, digest, sig2));

	// malleable twin: s' = n - s with flipped v is a valid ECDSA signature, yet rejected
	Hash n = HashFromHex("fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141");
	sig2 = sig;
	sig2.m_S.Negate();
	sig2.m_S += n;
	sig2.m_V ^= 1;
	verify_test(!sig2.IsWellFormed());
	verify_test(!ExtractSigner(signer, digest, sig2));
}

void TestAbi()
{
	std::cout << "TestAbi" << std::endl;

	// The domain from the reference example of typed data hashing
	Hash typeHash = HashOf("EIP712Domain(string name,string version,uint256 chainId,address verifyingContract)");
	verify_test(typeHash == HashFromHex("8b73c3c69bb8fe3d512ecc4cf759cc79239f7b179b0ffacaa9a75d522b39400f"));

	AbiHash hp;
	hp
		<< typeHash
		<< HashOf("Ether Mail")
		<< HashOf("1")
		<< uint64_t(1)
		<< AddrFromHex("0xCcCCccccCCCCcCCCCCCcCcCccCcCCCcCcccccccC");

	Hash hv;
	hp >> hv;
	verify_test(hv == HashFromHex("f2cee375fa42b42143804025fc449deafd50cc031ca257e0b194a650a912090f"));
}

} // namespace Eth
} // namespace wtoken

int main()
{
	try
	{
		wtoken::Eth::TestKeccak();
		wtoken::Eth::TestAddresses();
		wtoken::Eth::TestSignatures();
		wtoken::Eth::TestAbi();
	}
	catch (const std::exception& ex)
	{
		printf("Exception: %s\n", ex.what());
		g_TestsFailed++;
	}

	return g_TestsFailed ? -1 : 0;
}
