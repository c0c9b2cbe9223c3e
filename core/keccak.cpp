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

#include "keccak.h"
#include <ethash/keccak.h>
#include <algorithm>

namespace wtoken {

namespace
{
	// the sponge state is an array of little-endian lanes
	uint64_t LoadLE(const uint8_t* p)
	{
		uint64_t x = 0;
		for (uint32_t i = KeccakProcessorBase::nSizeWord; i--; )
			x = (x << 8) | p[i];
		return x;
	}

	void StoreLE(uint8_t* p, uint64_t x)
	{
		for (uint32_t i = 0; i < KeccakProcessorBase::nSizeWord; i++, x >>= 8)
			p[i] = (uint8_t) x;
	}
}

KeccakProcessorBase::KeccakProcessorBase()
{
	ZeroObject(m_pState);
	ZeroObject(m_pLastWord);
	m_iWord = 0;
	m_LastWordBytes = 0;
}

void KeccakProcessorBase::WriteInternal(const uint8_t* pSrc, uint32_t nSrc, uint32_t nWordsBlock)
{
	while (nSrc)
	{
		uint32_t nPortion = std::min(nSizeWord - m_LastWordBytes, nSrc);

		memcpy(m_pLastWord + m_LastWordBytes, pSrc, nPortion);
		pSrc += nPortion;
		nSrc -= nPortion;

		m_LastWordBytes += nPortion;
		if (nSizeWord == m_LastWordBytes)
		{
			m_LastWordBytes = 0;
			AddLastWordInternal(nWordsBlock);
		}
	}
}

void KeccakProcessorBase::ReadInternal(uint8_t* pRes, uint32_t nWordsBlock, uint32_t nBytes)
{
	// pad and transform
	assert(m_LastWordBytes < nSizeWord);
	m_pLastWord[m_LastWordBytes++] = 0x01;
	memset0(m_pLastWord + m_LastWordBytes, nSizeWord - m_LastWordBytes);

	AddLastWordRawInternal();

	m_pState[nWordsBlock - 1] ^= 0x8000000000000000;

	ethash_keccakf1600(m_pState);

	for (uint32_t i = 0; i < (nBytes / nSizeWord); ++i)
		StoreLE(pRes + i * nSizeWord, m_pState[i]);
}

void KeccakProcessorBase::AddLastWordRawInternal()
{
	assert(m_iWord < _countof(m_pState));
	m_pState[m_iWord] ^= LoadLE(m_pLastWord);
}

void KeccakProcessorBase::AddLastWordInternal(uint32_t nWordsBlock)
{
	AddLastWordRawInternal();
	memset0(m_pLastWord, nSizeWord);

	if (++m_iWord == nWordsBlock)
	{
		ethash_keccakf1600(m_pState);
		m_iWord = 0;
	}
}

} // namespace wtoken
