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
#include "uintBig.h"

namespace wtoken
{
	// Incremental keccak (the original padding, as used by Ethereum, not SHA3). Data may be written in several calls

	struct KeccakProcessorBase
	{
		static const uint32_t nSizeWord = sizeof(uint64_t);

	protected:

		KeccakProcessorBase();

		void WriteInternal(const uint8_t* pSrc, uint32_t nSrc, uint32_t nWordsBlock);
		void ReadInternal(uint8_t* pRes, uint32_t nWordsBlock, uint32_t nBytes);

		uint64_t m_pState[25];
		uint8_t m_pLastWord[nSizeWord];

		uint32_t m_iWord;
		uint32_t m_LastWordBytes;

		void AddLastWordRawInternal();
		void AddLastWordInternal(uint32_t nWordsBlock);
	};

	template <uint32_t nBits_>
	struct KeccakProcessor
		:public KeccakProcessorBase
	{
		static const uint32_t nBits = nBits_;
		static const uint32_t nBytes = nBits / 8;

		static const uint32_t nSizeBlock = (1600 - nBits * 2) / 8;
		static const uint32_t nWordsBlock = nSizeBlock / nSizeWord;

		KeccakProcessor()
		{
			static_assert(nWordsBlock <= _countof(m_pState), "");
		}

		void Write(const uint8_t* pSrc, uint32_t nSrc)
		{
			WriteInternal(pSrc, nSrc, nWordsBlock);
		}

		void Write(const void* pSrc, uint32_t nSrc)
		{
			Write(reinterpret_cast<const uint8_t*>(pSrc), nSrc);
		}

		void Write(const Blob& x) { Write(x.p, x.n); }
		void Write(const std::string& s) { Write(s.data(), static_cast<uint32_t>(s.size())); }
		void Write(const char* sz) { Write(sz, static_cast<uint32_t>(strlen(sz))); }
		void Write(uint8_t x) { Write(&x, 1); }

		template <uint32_t nBytes_>
		void Write(const uintBig_t<nBytes_>& x) { Write(x.m_pData, x.nBytes); }

		template <typename T>
		KeccakProcessor& operator << (const T& t) { Write(t); return *this; }

		void Read(uint8_t* pRes)
		{
			ReadInternal(pRes, nWordsBlock, nBytes);
		}

		void operator >> (uintBig_t<nBytes>& hv)
		{
			Read(hv.m_pData);
		}
	};

	typedef KeccakProcessor<256> Keccak256;

} // namespace wtoken
