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

#include "conversion.h"
#include "ledger.h"
#include "transfer_gate.h"
#include "permit.h"
#include "access_control.h"
#include "records.h"

namespace wtoken::vault
{
	struct StateVersion
	{
		uint32_t m_Version = 0;
		Address m_Implementation = Zero;
	};

	// Non-rebasing share token over a rebasing asset.
	//
	// All the mutating methods take the calling account explicitly, and each one is atomic: on exception
	// the balances, allowances, nonces and pending records are exactly as before the call.
	// Nested mutating calls (e.g. from the asset while it executes a transfer) are rejected.
	class WrappedToken
	{
	public:
		struct Params
		{
			std::string m_Name;
			std::string m_Symbol;
			Address m_Self = Zero; // the vault account, holds the assets
			ISignerRecovery::Ptr m_pRecovery; // optional, secp256k1 by default
		};

		WrappedToken(const Params&, const IBlockContext&);

		void set_RecordHandler(IRecordHandler* p) { m_pRecordHandler = p; }

		// Binds the asset and grants the admin role. Only once
		void Initialize(const Address& caller, const IRebasingAsset::Ptr&, const Address& admin);
		bool IsInitialized() const { return m_Initialized; }

		const std::string& get_Name() const { return m_Name; }
		const std::string& get_Symbol() const { return m_Symbol; }
		uint32_t get_Decimals() const { return s_Decimals; }
		const Address& get_Self() const { return m_Self; }
		Address get_Asset() const;
		Amount get_TotalAssets() const;

		// ERC-20
		const Amount& get_TotalSupply() const { return m_Ledger.get_TotalSupply(); }
		Amount get_BalanceOf(const Address& x) const { return m_Ledger.get_BalanceOf(x); }
		Amount get_Allowance(const Address& owner, const Address& spender) const { return m_Ledger.get_Allowance(owner, spender); }

		void Transfer(const Address& caller, const Address& to, const Amount&);
		void TransferFrom(const Address& caller, const Address& from, const Address& to, const Amount&);
		void Approve(const Address& caller, const Address& spender, const Amount&);

		// ERC-4626
		ConversionEngine get_Engine() const;
		Amount ConvertToShares(const Amount& assets) const { return get_Engine().ConvertToShares(assets); }
		Amount ConvertToAssets(const Amount& shares) const { return get_Engine().ConvertToAssets(shares); }

		Amount get_MaxDeposit(const Address& receiver) const;
		Amount get_MaxMint(const Address& receiver) const;
		Amount get_MaxWithdraw(const Address& owner) const;
		Amount get_MaxRedeem(const Address& owner) const;

		Amount PreviewDeposit(const Amount& assets) const { return get_Engine().PreviewDeposit(assets); }
		Amount PreviewMint(const Amount& shares) const { return get_Engine().PreviewMint(shares); }
		Amount PreviewWithdraw(const Amount& assets) const { return get_Engine().PreviewWithdraw(assets); }
		Amount PreviewRedeem(const Amount& shares) const { return get_Engine().PreviewRedeem(shares); }

		// return the counterpart amount: shares for Deposit, assets for Mint etc.
		Amount Deposit(const Address& caller, const Amount& assets, const Address& receiver);
		Amount Mint(const Address& caller, const Amount& shares, const Address& receiver);
		Amount Withdraw(const Address& caller, const Amount& assets, const Address& receiver, const Address& owner);
		Amount Redeem(const Address& caller, const Amount& shares, const Address& receiver, const Address& owner);

		// ERC-2612
		void Permit(const Address& owner, const Address& spender, const Amount& value, const Eth::Word& deadline, const Eth::Signature&);
		Amount get_Nonce(const Address& owner) const { return m_Permits.get_Nonce(owner); }
		Hash get_DomainSeparator() const { return m_Permits.get_DomainSeparator(); }

		// Administration
		bool IsPaused() const { return m_Gate.IsPaused(); }
		void Pause(const Address& caller);
		void Unpause(const Address& caller);

		const IAccessController& get_AccessController() const { return m_Roles; }
		bool HasRole(const Role& role, const Address& account) const { return m_Roles.HasRole(role, account); }
		const Role& get_RoleAdmin(const Role& role) const { return m_Roles.get_RoleAdmin(role); }
		void GrantRole(const Address& caller, const Role&, const Address& account);
		void RevokeRole(const Address& caller, const Role&, const Address& account);
		void RenounceRole(const Address& caller, const Role&, const Address& account);

		// Hook for the upgrade orchestrator. Throws unless the caller holds the upgrade role
		void AuthorizeUpgrade(const Address& caller, const Address& implementation) const;
		void UpgradeTo(const Address& caller, const Address& implementation);
		const StateVersion& get_StateVersion() const { return m_StateVersion; }

	private:
		class Operation;

		IRebasingAsset& get_AssetRef() const;

		template <typename T>
		void Emit(const T& rec) { m_Journal.Add(rec); }

		void MoveShares(const Address& from, const Address& to, const Amount&);
		void MintShares(const Address& to, const Amount&);
		void BurnShares(const Address& from, const Amount&);
		void ApproveInternal(const Address& owner, const Address& spender, const Amount&);
		void SpendAllowance(const Address& owner, const Address& spender, const Amount&);

		void PullAssets(const Address& from, const Amount&);
		void PushAssets(const Address& to, const Amount&);

		std::string m_Name;
		std::string m_Symbol;
		Address m_Self;

		IRebasingAsset::Ptr m_pAsset;
		bool m_Initialized = false;
		bool m_Locked = false;

		Ledger m_Ledger;
		TransferGate m_Gate;
		PermitAuthority m_Permits;
		RoleTable m_Roles;
		StateVersion m_StateVersion;

		RecordJournal m_Journal;
		IRecordHandler* m_pRecordHandler = nullptr;
	};

} // namespace wtoken::vault
