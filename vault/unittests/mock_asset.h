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

#include "vault/rebasing_asset.h"
#include "vault/records.h"
#include <functional>
#include <set>
#include <vector>

namespace wtoken::vault::test
{
    inline Amount Units(const char* sz)
    {
        Amount x;
        if (!x.ScanDecimal(sz, s_Decimals))
            throw std::runtime_error(std::string("bad amount: ") + sz);
        return x;
    }

    inline Amount Wei(const char* sz)
    {
        Amount x;
        if (!x.ScanDecimal(sz))
            throw std::runtime_error(std::string("bad amount: ") + sz);
        return x;
    }

    inline Address MakeAddress(uint32_t n)
    {
        Address addr = Zero;
        addr = n;
        return addr;
    }

    // Rebasing token: holdings are kept in shares, the visible balance is shares * multiplier (floored).
    // Transferred amounts are converted to shares, floored as well.
    class MockRebasingAsset
        :public IRebasingAsset
    {
        struct Holder
        {
            Amount m_Shares = Zero;
            std::map<Address, Amount> m_Allowances;
        };

        std::map<Address, Holder> m_Holders;
        std::set<Address> m_Banned;
        Address m_Address;
        Amount m_Multiplier;
        bool m_Paused = false;

        static const Amount& get_Base()
        {
            static const Amount s_Base = Units("1");
            return s_Base;
        }

        Holder& get_Holder(const Address& addr)
        {
            auto it = m_Holders.find(addr);
            if (m_Holders.end() == it)
                it = m_Holders.emplace(addr, Holder()).first;
            return it->second;
        }

        Amount ToShares(const Amount& amount) const
        {
            Amount res;
            if (!MulDiv(res, amount, get_Base(), m_Multiplier, false))
                throw std::runtime_error("USDO: overflow");
            return res;
        }

        Amount ToAmount(const Amount& shares) const
        {
            Amount res;
            if (!MulDiv(res, shares, m_Multiplier, get_Base(), false))
                throw std::runtime_error("USDO: overflow");
            return res;
        }

        void MoveShares(const Address& from, const Address& to, const Amount& amount)
        {
            if (m_Paused)
                throw std::runtime_error("USDO: paused");
            if (m_Banned.count(from) || m_Banned.count(to))
                throw std::runtime_error("USDO: banned");
            if (m_FailTransfers)
                throw std::runtime_error("USDO: transfer failure");

            Amount shares = ToShares(amount);

            Holder& hFrom = get_Holder(from);
            if (hFrom.m_Shares < shares)
                throw std::runtime_error("USDO: transfer amount exceeds balance");

            hFrom.m_Shares -= shares;
            get_Holder(to).m_Shares += shares;
        }

    public:
        typedef std::shared_ptr<MockRebasingAsset> Ptr;

        // invoked on every transfer before it takes place
        std::function<void()> m_OnTransfer;
        bool m_FailTransfers = false;
        uint32_t m_Transfers = 0;

        explicit MockRebasingAsset(const Address& addr)
            :m_Address(addr)
            ,m_Multiplier(get_Base())
        {
        }

        void set_Multiplier(const Amount& x) { m_Multiplier = x; }
        void set_Paused(bool b) { m_Paused = b; }
        void Ban(const Address& addr) { m_Banned.insert(addr); }
        void Unban(const Address& addr) { m_Banned.erase(addr); }

        void Mint(const Address& to, const Amount& amount)
        {
            get_Holder(to).m_Shares += ToShares(amount);
        }

        void Approve(const Address& owner, const Address& spender, const Amount& amount)
        {
            get_Holder(owner).m_Allowances.insert_or_assign(spender, amount);
        }

        Amount get_SharesOf(const Address& addr) const
        {
            auto it = m_Holders.find(addr);
            return (m_Holders.end() == it) ? Amount(Zero) : it->second.m_Shares;
        }

        // IRebasingAsset
        Address get_Address() const override { return m_Address; }

        Amount get_BalanceOf(const Address& addr) const override
        {
            return ToAmount(get_SharesOf(addr));
        }

        bool IsPaused() const override { return m_Paused; }
        bool IsBanned(const Address& addr) const override { return m_Banned.count(addr) > 0; }

        void TransferFrom(const Address& spender, const Address& from, const Address& to, const Amount& amount) override
        {
            m_Transfers++;
            if (m_OnTransfer)
                m_OnTransfer();

            Holder& h = get_Holder(from);
            auto it = h.m_Allowances.find(spender);
            if ((h.m_Allowances.end() == it) || (it->second < amount))
                throw std::runtime_error("USDO: insufficient allowance");

            MoveShares(from, to, amount);

            if (it->second != Amount::get_Max())
                it->second -= amount;
        }

        void Transfer(const Address& from, const Address& to, const Amount& amount) override
        {
            m_Transfers++;
            if (m_OnTransfer)
                m_OnTransfer();

            MoveShares(from, to, amount);
        }
    };

    struct BlockContext
        :public IBlockContext
    {
        Timestamp m_Now = 1700000000;
        uint64_t m_ChainID = 31337;

        Timestamp get_Timestamp() const override { return m_Now; }
        uint64_t get_ChainID() const override { return m_ChainID; }
    };

    // Collects delivered records
    struct RecordCollector
        :public IRecordHandler
    {
        std::vector<Record::Transfer> m_Transfers;
        std::vector<Record::Approval> m_Approvals;
        std::vector<Record::Deposit> m_Deposits;
        std::vector<Record::Withdraw> m_Withdrawals;
        uint32_t m_Paused = 0;
        uint32_t m_Unpaused = 0;
        uint32_t m_RolesGranted = 0;
        uint32_t m_RolesRevoked = 0;
        uint32_t m_Upgrades = 0;
        uint32_t m_Initialized = 0;

        void OnRecord(const Record::Transfer& r) override { m_Transfers.push_back(r); }
        void OnRecord(const Record::Approval& r) override { m_Approvals.push_back(r); }
        void OnRecord(const Record::Deposit& r) override { m_Deposits.push_back(r); }
        void OnRecord(const Record::Withdraw& r) override { m_Withdrawals.push_back(r); }
        void OnRecord(const Record::Paused&) override { m_Paused++; }
        void OnRecord(const Record::Unpaused&) override { m_Unpaused++; }
        void OnRecord(const Record::RoleGranted&) override { m_RolesGranted++; }
        void OnRecord(const Record::RoleRevoked&) override { m_RolesRevoked++; }
        void OnRecord(const Record::Upgraded&) override { m_Upgrades++; }
        void OnRecord(const Record::Initialized&) override { m_Initialized++; }

        size_t get_Total() const
        {
            return m_Transfers.size() + m_Approvals.size() + m_Deposits.size() + m_Withdrawals.size()
                + m_Paused + m_Unpaused + m_RolesGranted + m_RolesRevoked + m_Upgrades + m_Initialized;
        }
    };

} // namespace wtoken::vault::test
