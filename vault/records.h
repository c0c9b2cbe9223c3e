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

#define WTokenRecord_Transfer(macro) \
	macro(Address, From) \
	macro(Address, To) \
	macro(Amount, Value)

#define WTokenRecord_Approval(macro) \
	macro(Address, Owner) \
	macro(Address, Spender) \
	macro(Amount, Value)

#define WTokenRecord_Deposit(macro) \
	macro(Address, Caller) \
	macro(Address, Receiver) \
	macro(Amount, Assets) \
	macro(Amount, Shares)

#define WTokenRecord_Withdraw(macro) \
	macro(Address, Caller) \
	macro(Address, Receiver) \
	macro(Address, Owner) \
	macro(Amount, Assets) \
	macro(Amount, Shares)

#define WTokenRecord_Paused(macro) \
	macro(Address, Account)

#define WTokenRecord_Unpaused(macro) \
	macro(Address, Account)

#define WTokenRecord_RoleGranted(macro) \
	macro(Role, Role) \
	macro(Address, Account) \
	macro(Address, Sender)

#define WTokenRecord_RoleRevoked(macro) \
	macro(Role, Role) \
	macro(Address, Account) \
	macro(Address, Sender)

#define WTokenRecord_Upgraded(macro) \
	macro(Address, Implementation)

#define WTokenRecord_Initialized(macro) \
	macro(uint32_t, Version)

#define WTokenRecordsAll(macro) \
	macro(Transfer) \
	macro(Approval) \
	macro(Deposit) \
	macro(Withdraw) \
	macro(Paused) \
	macro(Unpaused) \
	macro(RoleGranted) \
	macro(RoleRevoked) \
	macro(Upgraded) \
	macro(Initialized)

namespace wtoken::vault
{
	// Observable effects of committed operations
	namespace Record
	{
#define THE_FIELD(type, name) type m_##name;
#define THE_MACRO(name) \
		struct name \
		{ \
			WTokenRecord_##name(THE_FIELD) \
		};

		WTokenRecordsAll(THE_MACRO)
#undef THE_MACRO
#undef THE_FIELD
	}

	struct IRecordHandler
	{
		virtual ~IRecordHandler() {}

#define THE_MACRO(name) virtual void OnRecord(const Record::name&) {}
		WTokenRecordsAll(THE_MACRO)
#undef THE_MACRO
	};

	// Records of the operation in progress. Delivered once the operation commits, dropped otherwise
	class RecordJournal
	{
		struct Entry
			:public boost::intrusive::list_base_hook<>
		{
			virtual ~Entry() {}
			virtual void Deliver(IRecordHandler&) const = 0;
		};

		template <typename T>
		struct Entry_T
			:public Entry
		{
			T m_Record;
			~Entry_T() override {}
			void Deliver(IRecordHandler& h) const override { h.OnRecord(m_Record); }
		};

		typedef intrusive::list_autoclear<Entry> List;
		List m_lst;

	public:
		template <typename T>
		void Add(const T& rec)
		{
			auto* p = new Entry_T<T>;
			p->m_Record = rec;
			m_lst.push_back(*p);
		}

		void Discard()
		{
			m_lst.Clear();
		}

		// Handler may be null, then the records are just dropped
		void Flush(IRecordHandler* pHandler)
		{
			List lst;
			lst.splice(lst.end(), m_lst);

			if (pHandler)
			{
				for (const auto& e : lst)
					e.Deliver(*pHandler);
			}
		}
	};

} // namespace wtoken::vault
