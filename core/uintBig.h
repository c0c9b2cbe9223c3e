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
#include "../utility/common.h"

namespace wtoken
{
	// Syntactic sugar!
	enum Zero_ { Zero };

	// Fixed-width unsigned arithmetics, big-endian byte arrays. Not constant-time.

	class uintBigImpl {
	protected:
		static void _Assign(uint8_t* pDst, uint32_t nDst, const uint8_t* pSrc, uint32_t nSrc);

		// all those return carry (exceeding byte)
		static uint8_t _Inc(uint8_t* pDst, uint32_t nDst);
		static uint8_t _Inc(uint8_t* pDst, uint32_t nDst, const uint8_t* pSrc);
		static uint8_t _Inc(uint8_t* pDst, uint32_t nDst, const uint8_t* pSrc, uint32_t nSrc);

		// return borrow (1 if the result wrapped)
		static uint8_t _Dec(uint8_t* pDst, uint32_t nDst, const uint8_t* pSrc);
		static uint8_t _Dec(uint8_t* pDst, uint32_t nDst, const uint8_t* pSrc, uint32_t nSrc);

		static void _Inv(uint8_t* pDst, uint32_t nDst);

		static void _Mul(uint8_t* pDst, uint32_t nDst, const uint8_t* pSrc0, uint32_t nSrc0, const uint8_t* pSrc1, uint32_t nSrc1);

		// pQuot must be nNum bytes, pResid nDen bytes. Returns false on division by zero
		static bool _Div(uint8_t* pQuot, uint8_t* pResid, const uint8_t* pNum, uint32_t nNum, const uint8_t* pDen, uint32_t nDen);

		// in-place, with small operands. Used for decimal conversion
		static uint32_t _DivSmall(uint8_t* pDst, uint32_t nDst, uint32_t div); // returns remainder
		static uint32_t _MulAddSmall(uint8_t* pDst, uint32_t nDst, uint32_t mul, uint32_t add); // returns carry

		static int _Cmp(const uint8_t* pSrc0, uint32_t nSrc0, const uint8_t* pSrc1, uint32_t nSrc1);
		static void _Print(const uint8_t* pDst, uint32_t nDst, std::ostream&);
		static void _Print(const uint8_t* pDst, uint32_t nDst, char*);
		static std::string _PrintDecimal(const uint8_t* pDst, uint32_t nDst, uint32_t nDecimals);
		static bool _ScanDecimal(uint8_t* pDst, uint32_t nDst, const char* sz, uint32_t nDecimals);
		static bool _ScanHex(uint8_t* pDst, uint32_t nDst, const std::string&);

		static uint32_t _GetOrder(const uint8_t* pDst, uint32_t nDst);

		template <typename T>
		static void _AssignRangeAligned(uint8_t* pDst, uint32_t nDst, T x, uint32_t nOffsetBytes, uint32_t nBytesX)
		{
			static_assert(T(-1) > 0, "must be unsigned");

			assert(nDst >= nBytesX + nOffsetBytes);
			nDst -= (nOffsetBytes + nBytesX);

			for (uint32_t i = nBytesX; i--; x >>= 8)
				pDst[nDst + i] = (uint8_t) x;
		}

		template <typename T>
		static void _ExportAligned(T& out, const uint8_t* pDst, uint32_t nDst)
		{
			static_assert(T(-1) > 0, "must be unsigned");

			out = pDst[0];
			for (uint32_t i = 1; i < nDst; i++)
				out = (out << 8) | pDst[i];
		}
	};

	template <uint32_t nBytes_>
	struct uintBig_t
		:public uintBigImpl
	{
		static const uint32_t nBits = nBytes_ << 3;
		static const uint32_t nBytes = nBytes_;

		uintBig_t()
		{
#ifdef _DEBUG
			memset(m_pData, 0xcd, nBytes);
#endif // _DEBUG
		}

		uintBig_t(Zero_)
		{
			ZeroObject(m_pData);
		}

		uintBig_t(const uint8_t p[nBytes])
		{
			memcpy(m_pData, p, nBytes);
		}

		uintBig_t(const std::initializer_list<uint8_t>& v)
		{
			_Assign(m_pData, nBytes, v.begin(), static_cast<uint32_t>(v.size()));
		}

		uintBig_t(const Blob& v)
		{
			operator = (v);
		}

		template <typename T>
		uintBig_t(T x)
		{
			AssignOrdinal(x);
		}

		// in Big-Endian representation
		uint8_t m_pData[nBytes];

		uintBig_t& operator = (Zero_)
		{
			ZeroObject(m_pData);
			return *this;
		}

		// narrowing keeps the least significant bytes
		template <uint32_t nBytesOther_>
		uintBig_t& operator = (const uintBig_t<nBytesOther_>& v)
		{
			_Assign(m_pData, nBytes, v.m_pData, v.nBytes);
			return *this;
		}

		uintBig_t& operator = (const Blob& v)
		{
			_Assign(m_pData, nBytes, static_cast<const uint8_t*>(v.p), v.n);
			return *this;
		}

		bool operator == (Zero_) const
		{
			return memis0(m_pData, nBytes);
		}

		bool operator != (Zero_) const
		{
			return !memis0(m_pData, nBytes);
		}

		static uintBig_t get_Max()
		{
			uintBig_t x(Zero);
			x.Inv();
			return x;
		}

		template <typename T>
		void AssignOrdinal(T x)
		{
			memset0(m_pData, nBytes - sizeof(x));
			AssignRange<T, 0>(x);
		}

		// from ordinal types (unsigned)
		template <typename T>
		uintBig_t& operator = (T x)
		{
			AssignOrdinal(x);
			return *this;
		}

		template <typename T>
		void Export(T& x) const
		{
			static_assert(sizeof(T) >= nBytes, "");
			_ExportAligned(x, m_pData, nBytes);
		}

		// returns false if the value doesn't fit
		template <typename T>
		bool ExportSafe(T& x) const
		{
			if (nBytes > sizeof(T))
			{
				if (!memis0(m_pData, nBytes - sizeof(T)))
					return false;
				_ExportAligned(x, m_pData + nBytes - sizeof(T), sizeof(T));
			}
			else
				_ExportAligned(x, m_pData, nBytes);
			return true;
		}

		template <typename T, uint32_t nOffset>
		void AssignRange(T x)
		{
			static_assert(!(nOffset & 7), "offset must be on byte boundary");
			static_assert(nBytes >= sizeof(x) + (nOffset >> 3), "too small");

			_AssignRangeAligned<T>(m_pData, nBytes, x, nOffset >> 3, sizeof(x));
		}

		uint8_t Inc()
		{
			return _Inc(m_pData, nBytes);
		}

		template <uint32_t nBytesOther_>
		uint8_t operator += (const uintBig_t<nBytesOther_>& x)
		{
			return _Inc(m_pData, nBytes, x.m_pData, x.nBytes);
		}

		template <uint32_t nBytesOther_>
		uint8_t operator -= (const uintBig_t<nBytesOther_>& x)
		{
			return _Dec(m_pData, nBytes, x.m_pData, x.nBytes);
		}

		template <uint32_t nBytes0, uint32_t nBytes1>
		void AssignMul(const uintBig_t<nBytes0>& x0, const uintBig_t<nBytes1> & x1)
		{
			_Mul(m_pData, nBytes, x0.m_pData, x0.nBytes, x1.m_pData, x1.nBytes);
		}

		template <uint32_t nBytesOther_>
		uintBig_t<nBytes + nBytesOther_> operator * (const uintBig_t<nBytesOther_>& x) const
		{
			uintBig_t<nBytes + nBytesOther_> res;
			res.AssignMul(*this, x);
			return res;
		}

		// this = num / den, truncated toward zero. Returns false on division by zero
		template <uint32_t nBytesNum_, uint32_t nBytesDen_>
		bool AssignDiv(const uintBig_t<nBytesNum_>& num, const uintBig_t<nBytesDen_>& den, uintBig_t<nBytesDen_>* pResid = nullptr)
		{
			uintBig_t<nBytesNum_> quot;
			uintBig_t<nBytesDen_> resid;
			if (!_Div(quot.m_pData, resid.m_pData, num.m_pData, num.nBytes, den.m_pData, den.nBytes))
				return false;

			operator = (quot);
			if (pResid)
				*pResid = resid;
			return true;
		}

		void Inv()
		{
			_Inv(m_pData, nBytes);
		}

		void Negate()
		{
			Inv();
			Inc();
		}

		template <uint32_t nBytesOther_>
		int cmp(const uintBig_t<nBytesOther_>& x) const
		{
			return _Cmp(m_pData, nBytes, x.m_pData, x.nBytes);
		}

		uint32_t get_Order() const
		{
			// how much the number should be shifted to reach zero.
			// returns 0 iff the number is already zero.
			return _GetOrder(m_pData, nBytes);
		}

		COMPARISON_VIA_CMP

		static const uint32_t nTxtLen = nBytes * 2; // not including 0-term

		void Print(char* sz) const
		{
			_Print(m_pData, nBytes, sz);
		}

		std::string str() const
		{
			char sz[nTxtLen + 1];
			Print(sz);
			return sz;
		}

		// decimal, optionally as a fixed-point number with nDecimals fractional digits
		std::string str_dec(uint32_t nDecimals = 0) const
		{
			return _PrintDecimal(m_pData, nBytes, nDecimals);
		}

		// accepts "123", "1.5" etc. Fails on junk, excess fractional digits and overflow
		bool ScanDecimal(const char* sz, uint32_t nDecimals = 0)
		{
			return _ScanDecimal(m_pData, nBytes, sz, nDecimals);
		}

		// hex, with or without 0x prefix. Shorter input is zero-extended on the left
		bool Scan(const std::string& s)
		{
			return _ScanHex(m_pData, nBytes, s);
		}

		friend std::ostream& operator << (std::ostream& s, const uintBig_t& x)
		{
			_Print(x.m_pData, x.nBytes, s);
			return s;
		}
	};

	// res = x * y / d over the double-width product, rounded down or up.
	// Returns false if d is zero or the result doesn't fit.
	template <uint32_t nBytes_>
	bool MulDiv(uintBig_t<nBytes_>& res, const uintBig_t<nBytes_>& x, const uintBig_t<nBytes_>& y, const uintBig_t<nBytes_>& d, bool bRoundUp)
	{
		uintBig_t<nBytes_ * 2> quot;
		uintBig_t<nBytes_> resid;
		if (!quot.AssignDiv(x * y, d, &resid))
			return false;

		if (bRoundUp && (resid != Zero) && quot.Inc())
			return false;

		if (!memis0(quot.m_pData, nBytes_))
			return false;

		res = quot;
		return true;
	}

} // namespace wtoken
