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

#include "core/eth.h"

namespace wtoken::vault
{
	using Eth::Address;
	using Eth::Hash;

	typedef uintBig_t<32> Amount; // 18-decimal fixed point, both for shares and assets
	typedef Eth::Hash Role;

	static const uint32_t s_Decimals = 18;

	std::string FormatAmount(const Amount&); // decimal, in base units

	// What the vault knows about the surrounding chain
	struct IBlockContext
	{
		virtual ~IBlockContext() {}
		virtual Timestamp get_Timestamp() const = 0;
		virtual uint64_t get_ChainID() const = 0;
	};

	class VaultException : public std::runtime_error
	{
	public:
		enum class Type : uint8_t
		{
			TransfersPaused,
			BlockedSender,
			BlockedReceiver,
			InvalidSignature,
			ExpiredDeadline,
			Unauthorized,
			AlreadyInitialized,
			NotInitialized,
			EnforcedPause,
			ExpectedPause,
			ExceededMax,
			InsufficientBalance,
			InsufficientAllowance,
			ZeroAddress,
			Overflow,
			ReentrantCall,
		};

		VaultException(const std::string& str, Type type)
			: std::runtime_error(str)
			, m_type(type)
		{
		}

		Type type() const { return m_type; }

	private:
		Type m_type;
	};

	class BlockedAccountException : public VaultException
	{
	public:
		BlockedAccountException(const Address& account, bool bSender);
		const Address m_Account;
	};

	class InvalidSignatureException : public VaultException
	{
	public:
		InvalidSignatureException(const Address& owner, const Address& spender);
		const Address m_Owner;
		const Address m_Spender;
	};

	class ExpiredDeadlineException : public VaultException
	{
	public:
		ExpiredDeadlineException(const Eth::Word& deadline, Timestamp now);
		const Eth::Word m_Deadline;
		const Timestamp m_Now;
	};

	class UnauthorizedException : public VaultException
	{
	public:
		UnauthorizedException(const Address& account, const Role& role);
		UnauthorizedException(const std::string& str, const Address& account, const Role& role);
		const Address m_Account;
		const Role m_Role;
	};

	class ExceededMaxException : public VaultException
	{
	public:
		enum struct Op { Deposit, Mint, Withdraw, Redeem };

		ExceededMaxException(Op, const Address& account, const Amount& requested, const Amount& max);
		const Op m_Op;
		const Address m_Account;
		const Amount m_Requested;
		const Amount m_Max;
	};

	// Insufficient balance or allowance, depending on the type
	class InsufficientFundsException : public VaultException
	{
	public:
		InsufficientFundsException(Type, const Address& account, const Amount& available, const Amount& requested);
		const Address m_Account;
		const Amount m_Available;
		const Amount m_Requested;
	};

	// Checked arithmetics, never wraps
	namespace Strict
	{
		void Add(Amount& a, const Amount& b);
		void Sub(Amount& a, const Amount& b);

		inline Amount Sum(Amount a, const Amount& b)
		{
			Add(a, b);
			return a;
		}
	}

} // namespace wtoken::vault
