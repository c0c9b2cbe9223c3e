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

#include "ledger.h"

namespace wtoken::vault
{
	struct Ledger::UndoOp::CreateAccount
		:public Base
	{
		Account& m_Account;
		CreateAccount(Account& acc) :m_Account(acc) {}
		~CreateAccount() override {}
		void Undo(Ledger& l) override
		{
			l.m_Accounts.Delete(m_Account);
		}
	};

	struct Ledger::UndoOp::CreateAllowance
		:public Base
	{
		Account& m_Account;
		Account::Allowance& m_Allowance;
		CreateAllowance(Account& acc, Account::Allowance& a)
			:m_Account(acc)
			,m_Allowance(a)
		{}
		~CreateAllowance() override {}
		void Undo(Ledger&) override
		{
			m_Account.m_Allowances.Delete(m_Allowance);
		}
	};

	struct Ledger::UndoOp::AmountSet
		:public Base
	{
		Amount& m_Trg;
		Amount m_Val0;

		AmountSet(Amount& trg)
			:m_Trg(trg)
			,m_Val0(trg)
		{}
		~AmountSet() override {}

		void Undo(Ledger&) override
		{
			m_Trg = m_Val0;
		}
	};

	Ledger::Transaction::Transaction(Ledger& l)
		:m_Ledger(l)
	{
		if (m_Ledger.m_InTransaction)
			throw std::logic_error("ledger transaction already in progress");
		m_Ledger.m_InTransaction = true;
	}

	Ledger::Transaction::~Transaction()
	{
		if (!m_Committed)
			m_Ledger.Rollback();
		m_Ledger.m_InTransaction = false;
	}

	void Ledger::Transaction::Commit()
	{
		m_Ledger.m_lstUndo.Clear();
		m_Committed = true;
	}

	Ledger::Ledger()
		:m_TotalSupply(Zero)
	{
	}

	Ledger::~Ledger()
	{
		m_lstUndo.Clear(); // before the accounts
	}

	void Ledger::Rollback()
	{
		while (!m_lstUndo.empty())
		{
			auto& op = m_lstUndo.back();
			op.Undo(*this);
			m_lstUndo.Delete(op);
		}
	}

	bool Ledger::IsInfinite(const Amount& allowance)
	{
		return allowance == Amount::get_Max();
	}

	const Ledger::Account* Ledger::FindAccount(const Address& addr) const
	{
		return m_Accounts.Find(addr);
	}

	Amount Ledger::get_BalanceOf(const Address& addr) const
	{
		const Account* pAcc = FindAccount(addr);
		return pAcc ? pAcc->m_Balance : Amount(Zero);
	}

	Amount Ledger::get_Allowance(const Address& owner, const Address& spender) const
	{
		const Account* pAcc = FindAccount(owner);
		if (pAcc)
		{
			const Account::Allowance* pA = pAcc->m_Allowances.Find(spender);
			if (pA)
				return pA->m_Value;
		}
		return Zero;
	}

	void Ledger::PushUndo(UndoOp::Base* pOp)
	{
		m_lstUndo.push_back(*pOp);
	}

	Ledger::Account& Ledger::TouchAccount(const Address& addr)
	{
		Account* pAcc = m_Accounts.Find(addr);
		if (!pAcc)
		{
			pAcc = m_Accounts.Create(addr);
			if (m_InTransaction)
				PushUndo(new UndoOp::CreateAccount(*pAcc));
		}
		return *pAcc;
	}

	Ledger::Account::Allowance& Ledger::TouchAllowance(Account& acc, const Address& spender)
	{
		Account::Allowance* pA = acc.m_Allowances.Find(spender);
		if (!pA)
		{
			pA = acc.m_Allowances.Create(spender);
			if (m_InTransaction)
				PushUndo(new UndoOp::CreateAllowance(acc, *pA));
		}
		return *pA;
	}

	void Ledger::UpdateAmount(Amount& trg, const Amount& val)
	{
		if (trg == val)
			return;

		if (m_InTransaction)
			PushUndo(new UndoOp::AmountSet(trg));
		trg = val;
	}

	void Ledger::Mint(const Address& to, const Amount& amount)
	{
		// the balance is bounded by the supply, so it can't overflow if the supply doesn't
		Amount supply = Strict::Sum(m_TotalSupply, amount);

		Account& acc = TouchAccount(to);
		UpdateAmount(acc.m_Balance, Strict::Sum(acc.m_Balance, amount));
		UpdateAmount(m_TotalSupply, supply);
	}

	void Ledger::Burn(const Address& from, const Amount& amount)
	{
		Amount bal = get_BalanceOf(from);
		if (bal < amount)
			throw InsufficientFundsException(VaultException::Type::InsufficientBalance, from, bal, amount);

		Strict::Sub(bal, amount);
		Amount supply = m_TotalSupply;
		Strict::Sub(supply, amount);

		UpdateAmount(TouchAccount(from).m_Balance, bal);
		UpdateAmount(m_TotalSupply, supply);
	}

	void Ledger::Move(const Address& from, const Address& to, const Amount& amount)
	{
		Amount bal = get_BalanceOf(from);
		if (bal < amount)
			throw InsufficientFundsException(VaultException::Type::InsufficientBalance, from, bal, amount);

		if (from == to)
			return;

		Strict::Sub(bal, amount);
		Amount balTo = Strict::Sum(get_BalanceOf(to), amount);

		UpdateAmount(TouchAccount(from).m_Balance, bal);
		UpdateAmount(TouchAccount(to).m_Balance, balTo);
	}

	void Ledger::SetAllowance(const Address& owner, const Address& spender, const Amount& value)
	{
		Account& acc = TouchAccount(owner);
		UpdateAmount(TouchAllowance(acc, spender).m_Value, value);
	}

	bool Ledger::SpendAllowance(const Address& owner, const Address& spender, const Amount& amount)
	{
		Amount val = get_Allowance(owner, spender);
		if (IsInfinite(val))
			return false;

		if (val < amount)
			throw InsufficientFundsException(VaultException::Type::InsufficientAllowance, spender, val, amount);

		Strict::Sub(val, amount);
		SetAllowance(owner, spender, val);
		return true;
	}

} // namespace wtoken::vault
