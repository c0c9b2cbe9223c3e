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

#include "common.h"

namespace wtoken::vault
{
	namespace
	{
		const char* get_OpName(ExceededMaxException::Op op)
		{
			switch (op)
			{
			case ExceededMaxException::Op::Deposit: return "deposit";
			case ExceededMaxException::Op::Mint: return "mint";
			case ExceededMaxException::Op::Withdraw: return "withdraw";
			case ExceededMaxException::Op::Redeem: return "redeem";
			}
			return "";
		}

		std::string FormatExceededMax(ExceededMaxException::Op op, const Address& account, const Amount& requested, const Amount& max)
		{
			std::ostringstream os;
			os << "ERC4626: " << get_OpName(op) << " more than max, account " << Eth::ToString(account)
				<< ", requested " << FormatAmount(requested) << ", max " << FormatAmount(max);
			return os.str();
		}

		std::string FormatInsufficient(VaultException::Type type, const Address& account, const Amount& available, const Amount& requested)
		{
			std::ostringstream os;
			os << ((VaultException::Type::InsufficientAllowance == type) ? "ERC20: insufficient allowance" : "ERC20: amount exceeds balance")
				<< ", account " << Eth::ToString(account)
				<< ", available " << FormatAmount(available)
				<< ", requested " << FormatAmount(requested);
			return os.str();
		}
	}

	std::string FormatAmount(const Amount& x)
	{
		return x.str_dec();
	}

	BlockedAccountException::BlockedAccountException(const Address& account, bool bSender)
		: VaultException(std::string(bSender ? "wToken: blocked sender " : "wToken: blocked receiver ") + Eth::ToString(account),
			bSender ? Type::BlockedSender : Type::BlockedReceiver)
		, m_Account(account)
	{
	}

	InvalidSignatureException::InvalidSignatureException(const Address& owner, const Address& spender)
		: VaultException("ERC2612: invalid signature, owner " + Eth::ToString(owner) + ", spender " + Eth::ToString(spender), Type::InvalidSignature)
		, m_Owner(owner)
		, m_Spender(spender)
	{
	}

	ExpiredDeadlineException::ExpiredDeadlineException(const Eth::Word& deadline, Timestamp now)
		: VaultException("ERC2612: expired deadline " + deadline.str_dec() + ", block timestamp " + std::to_string(now), Type::ExpiredDeadline)
		, m_Deadline(deadline)
		, m_Now(now)
	{
	}

	UnauthorizedException::UnauthorizedException(const Address& account, const Role& role)
		: UnauthorizedException("AccessControl: account " + Eth::ToString(account) + " is missing role " + Eth::ToString(role), account, role)
	{
	}

	UnauthorizedException::UnauthorizedException(const std::string& str, const Address& account, const Role& role)
		: VaultException(str, Type::Unauthorized)
		, m_Account(account)
		, m_Role(role)
	{
	}

	ExceededMaxException::ExceededMaxException(Op op, const Address& account, const Amount& requested, const Amount& max)
		: VaultException(FormatExceededMax(op, account, requested, max), Type::ExceededMax)
		, m_Op(op)
		, m_Account(account)
		, m_Requested(requested)
		, m_Max(max)
	{
	}

	InsufficientFundsException::InsufficientFundsException(Type type, const Address& account, const Amount& available, const Amount& requested)
		: VaultException(FormatInsufficient(type, account, available, requested), type)
		, m_Account(account)
		, m_Available(available)
		, m_Requested(requested)
	{
	}

	namespace Strict
	{
		void Add(Amount& a, const Amount& b)
		{
			if (a += b)
				throw VaultException("arithmetic overflow", VaultException::Type::Overflow);
		}

		void Sub(Amount& a, const Amount& b)
		{
			if (a < b)
				throw VaultException("arithmetic underflow", VaultException::Type::Overflow);
			a -= b;
		}
	}

} // namespace wtoken::vault
