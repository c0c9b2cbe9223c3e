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

#include "common.h"
#include "utility/containers.h"

namespace wtoken::vault
{
	// Share balances, total supply and allowances.
	// Every mutation made inside a Transaction is journaled, and reverted unless the transaction commits.
	class Ledger
	{
	public:
		struct Account
			:public intrusive::set_base_hook<Address>
		{
			virtual ~Account() {}
			typedef intrusive::multiset_autoclear<Account> Map;

			struct Allowance
				:public intrusive::set_base_hook<Address>
			{
				virtual ~Allowance() {}
				typedef intrusive::multiset_autoclear<Allowance> Map;

				Amount m_Value = Zero;
			};

			Amount m_Balance = Zero;
			Allowance::Map m_Allowances;
		};

		class Transaction
		{
			Ledger& m_Ledger;
			bool m_Committed = false;

		public:
			explicit Transaction(Ledger&);
			~Transaction();

			Transaction(const Transaction&) = delete;
			Transaction& operator = (const Transaction&) = delete;

			void Commit();
		};

		Ledger();
		~Ledger();

		const Amount& get_TotalSupply() const { return m_TotalSupply; }
		Amount get_BalanceOf(const Address&) const;
		Amount get_Allowance(const Address& owner, const Address& spender) const;

		static bool IsInfinite(const Amount& allowance);

		// Mutations. Throw on insufficient funds or overflow, leaving the ledger intact
		void Mint(const Address& to, const Amount&);
		void Burn(const Address& from, const Amount&);
		void Move(const Address& from, const Address& to, const Amount&);
		void SetAllowance(const Address& owner, const Address& spender, const Amount&);
		// returns false if the allowance is infinite and was left untouched
		bool SpendAllowance(const Address& owner, const Address& spender, const Amount&);

		bool IsInTransaction() const { return m_InTransaction; }

	private:
		struct UndoOp
		{
			struct Base
				:public boost::intrusive::list_base_hook<>
			{
				virtual ~Base() {}
				virtual void Undo(Ledger&) = 0;
			};

			typedef intrusive::list_autoclear<Base> List;

			struct CreateAccount;
			struct CreateAllowance;
			struct AmountSet;
		};

		Account::Map m_Accounts;
		Amount m_TotalSupply;
		UndoOp::List m_lstUndo;
		bool m_InTransaction = false;

		void Rollback();

		const Account* FindAccount(const Address&) const;
		Account& TouchAccount(const Address&);
		Account::Allowance& TouchAllowance(Account&, const Address& spender);
		void UpdateAmount(Amount& trg, const Amount& val);
		void PushUndo(UndoOp::Base*);
	};

} // namespace wtoken::vault
