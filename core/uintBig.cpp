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

#include "uintBig.h"
#include "../utility/helpers.h"
#include <algorithm>

namespace wtoken {

	char ChFromHex(uint8_t v)
	{
		return v + ((v < 10) ? '0' : ('a' - 10));
	}

	void uintBigImpl::_Print(const uint8_t* pDst, uint32_t nDst, std::ostream& s)
	{
		std::string sz(nDst * 2 + 1, '\0');
		_Print(pDst, nDst, &sz.front());
		sz.pop_back();
		s << sz;
	}

	void uintBigImpl::_Print(const uint8_t* pDst, uint32_t nDst, char* sz)
	{
		for (uint32_t i = 0; i < nDst; i++)
		{
			sz[i * 2] = ChFromHex(pDst[i] >> 4);
			sz[i * 2 + 1] = ChFromHex(pDst[i] & 0xf);
		}

		sz[nDst << 1] = 0;
	}

	void uintBigImpl::_Assign(uint8_t* pDst, uint32_t nDst, const uint8_t* pSrc, uint32_t nSrc)
	{
		if (nSrc >= nDst)
			memcpy(pDst, pSrc + nSrc - nDst, nDst);
		else
		{
			memset0(pDst, nDst - nSrc);
			memcpy(pDst + nDst - nSrc, pSrc, nSrc);
		}
	}

	uint8_t uintBigImpl::_Inc(uint8_t* pDst, uint32_t nDst)
	{
		for (uint32_t i = nDst; i--; )
			if (++pDst[i])
				return 0;

		return 1;
	}

	uint8_t uintBigImpl::_Inc(uint8_t* pDst, uint32_t nDst, const uint8_t* pSrc)
	{
		uint16_t carry = 0;
		for (uint32_t i = nDst; i--; )
		{
			carry += pDst[i];
			carry += pSrc[i];

			pDst[i] = (uint8_t) carry;
			carry >>= 8;
		}

		return (uint8_t) carry;
	}

	uint8_t uintBigImpl::_Inc(uint8_t* pDst, uint32_t nDst, const uint8_t* pSrc, uint32_t nSrc)
	{
		if (nDst <= nSrc)
		{
			// src is at least our size
			uint8_t carry = _Inc(pDst, nDst, pSrc + nSrc - nDst);
			return (carry || !memis0(pSrc, nSrc - nDst)) ? 1 : 0;
		}

		if (!_Inc(pDst + nDst - nSrc, nSrc, pSrc))
			return 0;

		// propagete carry
		return _Inc(pDst, nDst - nSrc);
	}

	uint8_t uintBigImpl::_Dec(uint8_t* pDst, uint32_t nDst, const uint8_t* pSrc)
	{
		uint8_t borrow = 0;
		for (uint32_t i = nDst; i--; )
		{
			int16_t v = int16_t(pDst[i]) - pSrc[i] - borrow;
			borrow = (v < 0);
			pDst[i] = (uint8_t) v;
		}

		return borrow;
	}

	uint8_t uintBigImpl::_Dec(uint8_t* pDst, uint32_t nDst, const uint8_t* pSrc, uint32_t nSrc)
	{
		if (nDst <= nSrc)
		{
			uint8_t borrow = _Dec(pDst, nDst, pSrc + nSrc - nDst);
			return (borrow || !memis0(pSrc, nSrc - nDst)) ? 1 : 0;
		}

		if (!_Dec(pDst + nDst - nSrc, nSrc, pSrc))
			return 0;

		for (uint32_t i = nDst - nSrc; i--; )
			if (pDst[i]--)
				return 0;

		return 1;
	}

	void uintBigImpl::_Inv(uint8_t* pDst, uint32_t nDst)
	{
		for (uint32_t i = nDst; i--; )
			pDst[i] ^= 0xff;
	}

	void uintBigImpl::_Mul(uint8_t* pDst, uint32_t nDst, const uint8_t* pSrc0, uint32_t nSrc0, const uint8_t* pSrc1, uint32_t nSrc1)
	{
		memset0(pDst, nDst);

		if (nSrc0 > nDst)
		{
			pSrc0 += nSrc0 - nDst;
			nSrc0 = nDst;
		}

		if (nSrc1 > nDst)
		{
			pSrc1 += nSrc1 - nDst;
			nSrc1 = nDst;
		}

		int32_t nDelta = nSrc0 + nSrc1 - nDst - 1;

		for (uint32_t i0 = nSrc0; i0--; )
		{
			uint8_t x0 = pSrc0[i0];
			uint16_t carry = 0;

			uint32_t iDst = i0 - nDelta; // don't care if overflows
			uint32_t i1Min = (iDst > nDst) ? (-static_cast<int32_t>(iDst)) : 0;
			for (uint32_t i1 = nSrc1; i1-- > i1Min; )
			{
				uint8_t& dst = pDst[iDst + i1];

				uint16_t x1 = pSrc1[i1];
				x1 *= x0;
				carry += x1;
				carry += dst;

				dst = (uint8_t) carry;
				carry >>= 8;
			}

			if (iDst <= nDst)
				while (carry && iDst--)
				{
					uint8_t& dst = pDst[iDst];
					carry += dst;

					dst = (uint8_t) carry;
					carry >>= 8;
				}
		}
	}

	bool uintBigImpl::_Div(uint8_t* pQuot, uint8_t* pResid, const uint8_t* pNum, uint32_t nNum, const uint8_t* pDen, uint32_t nDen)
	{
		if (memis0(pDen, nDen))
			return false;

		// running remainder, one extra byte for the shifted-out bit
		ByteBuffer r(nDen + 1, 0);
		uint8_t* pR = &r.front();

		memset0(pQuot, nNum);

		for (uint32_t iBit = _GetOrder(pNum, nNum); iBit--; )
		{
			uint32_t iByte = nNum - 1 - (iBit >> 3);
			uint8_t msk = uint8_t(1 << (iBit & 7));

			uint8_t bit = (pNum[iByte] & msk) ? 1 : 0;
			for (uint32_t i = nDen + 1; i--; )
			{
				uint8_t hi = pR[i] >> 7;
				pR[i] = uint8_t(pR[i] << 1) | bit;
				bit = hi;
			}

			if (_Cmp(pR, nDen + 1, pDen, nDen) >= 0)
			{
				_Dec(pR, nDen + 1, pDen, nDen);
				pQuot[iByte] |= msk;
			}
		}

		memcpy(pResid, pR + 1, nDen); // the remainder is below the divisor, top byte is zero
		return true;
	}

	uint32_t uintBigImpl::_DivSmall(uint8_t* pDst, uint32_t nDst, uint32_t div)
	{
		uint64_t resid = 0;
		for (uint32_t i = 0; i < nDst; i++)
		{
			resid = (resid << 8) | pDst[i];
			pDst[i] = (uint8_t) (resid / div);
			resid %= div;
		}

		return (uint32_t) resid;
	}

	uint32_t uintBigImpl::_MulAddSmall(uint8_t* pDst, uint32_t nDst, uint32_t mul, uint32_t add)
	{
		uint64_t carry = add;
		for (uint32_t i = nDst; i--; )
		{
			carry += uint64_t(pDst[i]) * mul;
			pDst[i] = (uint8_t) carry;
			carry >>= 8;
		}

		return (uint32_t) carry;
	}

	int uintBigImpl::_Cmp(const uint8_t* pSrc0, uint32_t nSrc0, const uint8_t* pSrc1, uint32_t nSrc1)
	{
		if (nSrc0 > nSrc1)
		{
			uint32_t diff = nSrc0 - nSrc1;
			if (!memis0(pSrc0, diff))
				return 1;

			pSrc0 += diff;
			nSrc0 = nSrc1;
		} else
			if (nSrc0 < nSrc1)
			{
				uint32_t diff = nSrc1 - nSrc0;
				if (!memis0(pSrc1, diff))
					return -1;

				pSrc1 += diff;
			}

		return memcmp(pSrc0, pSrc1, nSrc0);
	}

	uint32_t uintBigImpl::_GetOrder(const uint8_t* pDst, uint32_t nDst)
	{
		for (uint32_t nByte = 0; ; nByte++)
		{
			if (nDst == nByte)
				return 0; // the number is zero

			uint8_t x = pDst[nByte];
			if (!x)
				continue;

			uint32_t nOrder = ((nDst - nByte) << 3) - 7;
			while (x >>= 1)
				nOrder++;

			return nOrder;
		}
	}

	std::string uintBigImpl::_PrintDecimal(const uint8_t* pDst, uint32_t nDst, uint32_t nDecimals)
	{
		ByteBuffer buf(pDst, pDst + nDst);
		std::string s; // least significant digit first

		do
			s.push_back(char('0' + _DivSmall(&buf.front(), nDst, 10)));
		while (!memis0(&buf.front(), nDst));

		if (nDecimals)
		{
			while (s.size() <= nDecimals)
				s.push_back('0');

			// drop trailing zeroes of the fraction
			uint32_t nTrim = 0;
			while ((nTrim < nDecimals) && (s[nTrim] == '0'))
				nTrim++;

			std::string sFrac = s.substr(nTrim, nDecimals - nTrim);
			s.erase(0, nDecimals);

			if (!sFrac.empty())
				s = sFrac + '.' + s;
		}

		std::reverse(s.begin(), s.end());
		return s;
	}

	bool uintBigImpl::_ScanDecimal(uint8_t* pDst, uint32_t nDst, const char* sz, uint32_t nDecimals)
	{
		memset0(pDst, nDst);

		bool bDigits = false;
		bool bPoint = false;
		uint32_t nFrac = 0;

		for (; *sz; sz++)
		{
			char c = *sz;
			if ('.' == c)
			{
				if (bPoint || !nDecimals)
					return false;
				bPoint = true;
				continue;
			}

			if ((c < '0') || (c > '9'))
				return false;

			if (bPoint && (++nFrac > nDecimals))
				return false;

			if (_MulAddSmall(pDst, nDst, 10, c - '0'))
				return false; // overflow
			bDigits = true;
		}

		if (!bDigits)
			return false;

		for (; nFrac < nDecimals; nFrac++)
			if (_MulAddSmall(pDst, nDst, 10, 0))
				return false;

		return true;
	}

	bool uintBigImpl::_ScanHex(uint8_t* pDst, uint32_t nDst, const std::string& s)
	{
		bool bValid = false;
		ByteBuffer buf = from_hex(s, &bValid);
		if (!bValid || buf.empty() || (buf.size() > nDst))
			return false;

		_Assign(pDst, nDst, &buf.front(), static_cast<uint32_t>(buf.size()));
		return true;
	}

} // namespace wtoken
