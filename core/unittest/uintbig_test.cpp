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
#include "../uintBig.h"

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

typedef uintBig_t<32> Word;

Word FromDec(const char* sz)
{
	Word x;
	verify_test(x.ScanDecimal(sz));
	return x;
}

void TestArithmetics()
{
	Word a = 1000U, b = 7U;

	Word c = a;
	verify_test(!(c += b));
	verify_test(c == Word(1007U));

	verify_test(!(c -= a));
	verify_test(c == b);

	// borrow
	c = Zero;
	verify_test(c -= b);
	c += b;
	verify_test(c == Zero);

	// carry
	c = Word::get_Max();
	verify_test(c.Inc());
	verify_test(c == Zero);

	uintBig_t<64> prod = a * b;
	verify_test(prod == uintBig_t<64>(7000U));

	Word q, r;
	verify_test(q.AssignDiv(a, b, &r));
	verify_test(q == Word(142U));
	verify_test(r == Word(6U));

	verify_test(!q.AssignDiv(a, Word(Zero)));

	verify_test(a > b);
	verify_test(b < a);
	verify_test(Word(Zero).get_Order() == 0);
	verify_test(a.get_Order() == 10);
}

void TestMulDiv()
{
	Word res;

	// 10 * 10 / 3 = 33.33
	verify_test(MulDiv(res, Word(10U), Word(10U), Word(3U), false));
	verify_test(res == Word(33U));
	verify_test(MulDiv(res, Word(10U), Word(10U), Word(3U), true));
	verify_test(res == Word(34U));

	// exact, no rounding up
	verify_test(MulDiv(res, Word(10U), Word(9U), Word(3U), true));
	verify_test(res == Word(30U));

	// intermediate product exceeds 256 bits, the result doesn't
	Word big = Word::get_Max();
	verify_test(MulDiv(res, big, Word(6U), Word(3U), false) == false); // 2*max overflows
	verify_test(MulDiv(res, big, Word(3U), Word(6U), false));

	Word half;
	verify_test(half.AssignDiv(big, Word(2U)));
	verify_test(res == half);

	verify_test(!MulDiv(res, Word(1U), Word(1U), Word(Zero), false));

	verify_test(MulDiv(res, big, Word(1U), Word(1U), true));
	verify_test(res == big);

	Word x = FromDec("1337000000000000000000");
	Word y = FromDec("1000100000000000000");
	Word d = FromDec("1000000000000000000");
	verify_test(MulDiv(res, x, y, d, false));
	verify_test(res == FromDec("1337133700000000000000"));
}

void TestDecimal()
{
	Word x = FromDec("1999999692838904485");
	verify_test(x.str_dec() == "1999999692838904485");
	verify_test(x.str_dec(18) == "1.999999692838904485");

	Word y = Word::get_Max();
	verify_test(y.str_dec() == "115792089237316195423570985008687907853269984665640564039457584007913129639935");

	verify_test(Word(Zero).str_dec() == "0");
	verify_test(Word(Zero).str_dec(18) == "0");

	Word z;
	verify_test(z.ScanDecimal("1337.1337", 18));
	verify_test(z.str_dec() == "1337133700000000000000");
	verify_test(z.str_dec(18) == "1337.1337");

	verify_test(z.ScanDecimal("0.000000000000000001", 18));
	verify_test(z == Word(1U));

	verify_test(!z.ScanDecimal("0.0000000000000000001", 18)); // beyond the precision
	verify_test(!z.ScanDecimal("1.5")); // no fraction allowed
	verify_test(!z.ScanDecimal("12a"));
	verify_test(!z.ScanDecimal(""));
	verify_test(!z.ScanDecimal("115792089237316195423570985008687907853269984665640564039457584007913129639936"));
}

void TestHex()
{
	Word x;
	verify_test(x.Scan("0x0de0b6b3a7640000"));
	verify_test(x.str_dec() == "1000000000000000000");
	verify_test(x.str() == "0000000000000000000000000000000000000000000000000de0b6b3a7640000");

	verify_test(!x.Scan("xyz"));
	verify_test(!x.Scan(""));

	uintBig_t<4> small;
	verify_test(!small.Scan("0102030405"));
	verify_test(small.Scan("01020304"));

	uint32_t n = 0;
	small.Export(n);
	verify_test(0x01020304 == n);

	uint16_t n2 = 0;
	verify_test(!small.ExportSafe(n2));
}

} // namespace wtoken

int main()
{
	wtoken::TestArithmetics();
	wtoken::TestMulDiv();
	wtoken::TestDecimal();
	wtoken::TestHex();

	return g_TestsFailed ? -1 : 0;
}
