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

#include "wtoken.h"
#include "utility/logger.h"

namespace wtoken::vault
{
	// Scope of a single mutating call: reentrancy lock, ledger transaction and the pending records.
	// Unless committed, the ledger is rolled back and the records are dropped.
	class WrappedToken::Operation
	{
		struct Lock
		{
			bool& m_Locked;

			explicit Lock(bool& b)
				:m_Locked(b)
			{
				if (m_Locked)
					throw VaultException("ReentrancyGuard: reentrant call", VaultException::Type::ReentrantCall);
				m_Locked = true;
			}

			~Lock()
			{
				m_Locked = false;
			}
		};

		WrappedToken& m_This;
		Lock m_Lock; // must precede the transaction
		Ledger::Transaction m_Tx;
		bool m_Committed = false;

	public:
		Operation(WrappedToken& x, bool bInitializing = false)
			:m_This(x)
			,m_Lock(x.m_Locked)
			,m_Tx(x.m_Ledger)
		{
			if (!bInitializing && !x.m_Initialized)
				throw VaultException("wToken: not initialized", VaultException::Type::NotInitialized);
		}

		~Operation()
		{
			if (!m_Committed)
				m_This.m_Journal.Discard();
		}

		void Commit()
		{
			m_Tx.Commit();
			m_Committed = true;
			m_This.m_Journal.Flush(m_This.m_pRecordHandler);
		}
	};

	WrappedToken::WrappedToken(const Params& pars, const IBlockContext& ctx)
		:m_Name(pars.m_Name)
		,m_Symbol(pars.m_Symbol)
		,m_Self(pars.m_Self)
		,m_Permits(pars.m_Name, pars.m_Self, ctx, pars.m_pRecovery)
	{
	}

	void WrappedToken::Initialize(const Address& caller, const IRebasingAsset::Ptr& pAsset, const Address& admin)
	{
		Operation op(*this, true);

		if (m_Initialized)
			throw VaultException("Initializable: contract is already initialized", VaultException::Type::AlreadyInitialized);

		if (!pAsset)
			throw VaultException("wToken: asset is not set", VaultException::Type::ZeroAddress);

		if (m_Roles.Grant(Roles::DefaultAdmin(), admin))
			Emit(Record::RoleGranted{ Roles::DefaultAdmin(), admin, caller });

		m_pAsset = pAsset;
		m_Gate.set_Asset(pAsset);
		m_Initialized = true;

		m_StateVersion.m_Version = 1;
		Emit(Record::Initialized{ m_StateVersion.m_Version });

		op.Commit();

		LOG_INFO() << m_Symbol << " initialized, asset " << Eth::ToString(pAsset->get_Address()) << ", admin " << Eth::ToString(admin);
	}

	IRebasingAsset& WrappedToken::get_AssetRef() const
	{
		if (!m_pAsset)
			throw VaultException("wToken: not initialized", VaultException::Type::NotInitialized);
		return *m_pAsset;
	}

	Address WrappedToken::get_Asset() const
	{
		return get_AssetRef().get_Address();
	}

	Amount WrappedToken::get_TotalAssets() const
	{
		return get_AssetRef().get_BalanceOf(m_Self);
	}

	ConversionEngine WrappedToken::get_Engine() const
	{
		return ConversionEngine(get_TotalAssets(), m_Ledger.get_TotalSupply());
	}

	/////////////////////////////
	// Share movements
	void WrappedToken::MoveShares(const Address& from, const Address& to, const Amount& amount)
	{
		if (from == Zero)
			throw VaultException("ERC20: transfer from the zero address", VaultException::Type::ZeroAddress);
		if (to == Zero)
			throw VaultException("ERC20: transfer to the zero address", VaultException::Type::ZeroAddress);

		m_Gate.Check(from, to);
		m_Ledger.Move(from, to, amount);

		Emit(Record::Transfer{ from, to, amount });
	}

	void WrappedToken::MintShares(const Address& to, const Amount& amount)
	{
		if (to == Zero)
			throw VaultException("ERC20: mint to the zero address", VaultException::Type::ZeroAddress);

		m_Gate.Check(Zero, to);
		m_Ledger.Mint(to, amount);

		Emit(Record::Transfer{ Zero, to, amount });
	}

	void WrappedToken::BurnShares(const Address& from, const Amount& amount)
	{
		if (from == Zero)
			throw VaultException("ERC20: burn from the zero address", VaultException::Type::ZeroAddress);

		m_Gate.Check(from, Zero);
		m_Ledger.Burn(from, amount);

		Emit(Record::Transfer{ from, Zero, amount });
	}

	void WrappedToken::ApproveInternal(const Address& owner, const Address& spender, const Amount& amount)
	{
		if (owner == Zero)
			throw VaultException("ERC20: approve from the zero address", VaultException::Type::ZeroAddress);
		if (spender == Zero)
			throw VaultException("ERC20: approve to the zero address", VaultException::Type::ZeroAddress);

		m_Ledger.SetAllowance(owner, spender, amount);
		Emit(Record::Approval{ owner, spender, amount });
	}

	void WrappedToken::SpendAllowance(const Address& owner, const Address& spender, const Amount& amount)
	{
		if (m_Ledger.SpendAllowance(owner, spender, amount))
			Emit(Record::Approval{ owner, spender, m_Ledger.get_Allowance(owner, spender) });
	}

	void WrappedToken::PullAssets(const Address& from, const Amount& amount)
	{
		get_AssetRef().TransferFrom(m_Self, from, m_Self, amount);
	}

	void WrappedToken::PushAssets(const Address& to, const Amount& amount)
	{
		get_AssetRef().Transfer(m_Self, to, amount);
	}

	/////////////////////////////
	// ERC-20
	void WrappedToken::Transfer(const Address& caller, const Address& to, const Amount& amount)
	{
		Operation op(*this);
		MoveShares(caller, to, amount);
		op.Commit();
	}

	void WrappedToken::TransferFrom(const Address& caller, const Address& from, const Address& to, const Amount& amount)
	{
		Operation op(*this);
		SpendAllowance(from, caller, amount);
		MoveShares(from, to, amount);
		op.Commit();
	}

	void WrappedToken::Approve(const Address& caller, const Address& spender, const Amount& amount)
	{
		Operation op(*this);
		ApproveInternal(caller, spender, amount);
		op.Commit();
	}

	/////////////////////////////
	// ERC-4626
	Amount WrappedToken::get_MaxDeposit(const Address&) const
	{
		return IsPaused() ? Amount(Zero) : Amount::get_Max();
	}

	Amount WrappedToken::get_MaxMint(const Address&) const
	{
		return IsPaused() ? Amount(Zero) : Amount::get_Max();
	}

	Amount WrappedToken::get_MaxWithdraw(const Address& owner) const
	{
		if (IsPaused())
			return Zero;
		return get_Engine().ConvertToAssets(get_BalanceOf(owner), Rounding::Down);
	}

	Amount WrappedToken::get_MaxRedeem(const Address& owner) const
	{
		if (IsPaused())
			return Zero;
		return get_BalanceOf(owner);
	}

	Amount WrappedToken::Deposit(const Address& caller, const Amount& assets, const Address& receiver)
	{
		Operation op(*this);

		Amount maxAssets = get_MaxDeposit(receiver);
		if (assets > maxAssets)
			throw ExceededMaxException(ExceededMaxException::Op::Deposit, receiver, assets, maxAssets);

		Amount shares = PreviewDeposit(assets);

		// credit first, the pull is the last call that may fail
		MintShares(receiver, shares);
		PullAssets(caller, assets);

		Emit(Record::Deposit{ caller, receiver, assets, shares });
		op.Commit();

		LOG_DEBUG() << "Deposit " << Eth::ToString(caller) << " -> " << Eth::ToString(receiver) << ", assets=" << FormatAmount(assets) << ", shares=" << FormatAmount(shares);
		return shares;
	}

	Amount WrappedToken::Mint(const Address& caller, const Amount& shares, const Address& receiver)
	{
		Operation op(*this);

		Amount maxShares = get_MaxMint(receiver);
		if (shares > maxShares)
			throw ExceededMaxException(ExceededMaxException::Op::Mint, receiver, shares, maxShares);

		Amount assets = PreviewMint(shares);

		MintShares(receiver, shares);
		PullAssets(caller, assets);

		Emit(Record::Deposit{ caller, receiver, assets, shares });
		op.Commit();

		LOG_DEBUG() << "Mint " << Eth::ToString(caller) << " -> " << Eth::ToString(receiver) << ", assets=" << FormatAmount(assets) << ", shares=" << FormatAmount(shares);
		return assets;
	}

	Amount WrappedToken::Withdraw(const Address& caller, const Amount& assets, const Address& receiver, const Address& owner)
	{
		Operation op(*this);

		Amount maxAssets = get_MaxWithdraw(owner);
		if (assets > maxAssets)
			throw ExceededMaxException(ExceededMaxException::Op::Withdraw, owner, assets, maxAssets);

		Amount shares = PreviewWithdraw(assets);

		if (caller != owner)
			SpendAllowance(owner, caller, shares);

		// receiver is subject to the same ban policy as any share recipient
		m_Gate.Check(owner, receiver);

		BurnShares(owner, shares);
		PushAssets(receiver, assets);

		Emit(Record::Withdraw{ caller, receiver, owner, assets, shares });
		op.Commit();

		LOG_DEBUG() << "Withdraw " << Eth::ToString(owner) << " -> " << Eth::ToString(receiver) << ", assets=" << FormatAmount(assets) << ", shares=" << FormatAmount(shares);
		return shares;
	}

	Amount WrappedToken::Redeem(const Address& caller, const Amount& shares, const Address& receiver, const Address& owner)
	{
		Operation op(*this);

		Amount maxShares = get_MaxRedeem(owner);
		if (shares > maxShares)
			throw ExceededMaxException(ExceededMaxException::Op::Redeem, owner, shares, maxShares);

		Amount assets = PreviewRedeem(shares);

		if (caller != owner)
			SpendAllowance(owner, caller, shares);

		m_Gate.Check(owner, receiver);

		BurnShares(owner, shares);
		PushAssets(receiver, assets);

		Emit(Record::Withdraw{ caller, receiver, owner, assets, shares });
		op.Commit();

		LOG_DEBUG() << "Redeem " << Eth::ToString(owner) << " -> " << Eth::ToString(receiver) << ", assets=" << FormatAmount(assets) << ", shares=" << FormatAmount(shares);
		return assets;
	}

	/////////////////////////////
	// ERC-2612
	void WrappedToken::Permit(const Address& owner, const Address& spender, const Amount& value, const Eth::Word& deadline, const Eth::Signature& sig)
	{
		Operation op(*this);

		m_Permits.Verify(owner, spender, value, deadline, sig);
		ApproveInternal(owner, spender, value);
		m_Permits.UseNonce(owner); // last, nothing may fail after it

		op.Commit();

		LOG_DEBUG() << "Permit " << Eth::ToString(owner) << " -> " << Eth::ToString(spender) << ", value=" << FormatAmount(value);
	}

	/////////////////////////////
	// Administration
	void WrappedToken::Pause(const Address& caller)
	{
		Operation op(*this);

		m_Roles.RequireRole(Roles::Pause(), caller);
		if (IsPaused())
			throw VaultException("Pausable: paused", VaultException::Type::EnforcedPause);

		Emit(Record::Paused{ caller });
		m_Gate.set_LocalPaused(true);
		op.Commit();

		LOG_INFO() << m_Symbol << " paused by " << Eth::ToString(caller);
	}

	void WrappedToken::Unpause(const Address& caller)
	{
		Operation op(*this);

		m_Roles.RequireRole(Roles::Pause(), caller);
		// only the local flag is lifted here, a paused asset keeps the token paused
		if (!m_Gate.get_LocalPaused())
			throw VaultException("Pausable: not paused", VaultException::Type::ExpectedPause);

		Emit(Record::Unpaused{ caller });
		m_Gate.set_LocalPaused(false);
		op.Commit();

		LOG_INFO() << m_Symbol << " unpaused by " << Eth::ToString(caller);
	}

	void WrappedToken::GrantRole(const Address& caller, const Role& role, const Address& account)
	{
		Operation op(*this);

		m_Roles.RequireRole(m_Roles.get_RoleAdmin(role), caller);
		if (m_Roles.Grant(role, account))
		{
			Emit(Record::RoleGranted{ role, account, caller });
			LOG_INFO() << "Role " << Eth::ToString(role) << " granted to " << Eth::ToString(account);
		}

		op.Commit();
	}

	void WrappedToken::RevokeRole(const Address& caller, const Role& role, const Address& account)
	{
		Operation op(*this);

		m_Roles.RequireRole(m_Roles.get_RoleAdmin(role), caller);
		if (m_Roles.Revoke(role, account))
		{
			Emit(Record::RoleRevoked{ role, account, caller });
			LOG_INFO() << "Role " << Eth::ToString(role) << " revoked from " << Eth::ToString(account);
		}

		op.Commit();
	}

	void WrappedToken::RenounceRole(const Address& caller, const Role& role, const Address& account)
	{
		Operation op(*this);

		if (account != caller)
			throw UnauthorizedException("AccessControl: can only renounce roles for self", caller, role);

		if (m_Roles.Revoke(role, account))
		{
			Emit(Record::RoleRevoked{ role, account, caller });
			LOG_INFO() << "Role " << Eth::ToString(role) << " renounced by " << Eth::ToString(account);
		}

		op.Commit();
	}

	void WrappedToken::AuthorizeUpgrade(const Address& caller, const Address&) const
	{
		m_Roles.RequireRole(Roles::Upgrade(), caller);
	}

	void WrappedToken::UpgradeTo(const Address& caller, const Address& implementation)
	{
		Operation op(*this);

		AuthorizeUpgrade(caller, implementation);

		Emit(Record::Upgraded{ implementation });

		m_StateVersion.m_Version++;
		m_StateVersion.m_Implementation = implementation;
		op.Commit();

		LOG_INFO() << m_Symbol << " upgraded to " << Eth::ToString(implementation) << ", version " << m_StateVersion.m_Version;
	}

} // namespace wtoken::vault
