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
#include <set>

namespace wtoken::vault
{
	struct Roles
	{
		static const Role& DefaultAdmin(); // all zeroes
		static const Role& Pause(); // keccak256("PAUSE_ROLE")
		static const Role& Upgrade(); // keccak256("UPGRADE_ROLE")
	};

	struct IAccessController
	{
		typedef std::shared_ptr<IAccessController> Ptr;

		virtual ~IAccessController() {}
		virtual bool HasRole(const Role&, const Address&) const = 0;

		// throws UnauthorizedException
		void RequireRole(const Role&, const Address&) const;
	};

	// Role membership with a per-role admin role. Authorization of the callers is up to the owner of the table
	class RoleTable
		:public IAccessController
	{
		struct Entry
		{
			std::set<Address> m_Members;
			Role m_Admin = Zero;
		};

		std::map<Role, Entry> m_Roles;

	public:
		bool HasRole(const Role&, const Address&) const override;

		const Role& get_RoleAdmin(const Role&) const;
		void SetRoleAdmin(const Role& role, const Role& admin);

		// both return true if the membership has changed
		bool Grant(const Role&, const Address&);
		bool Revoke(const Role&, const Address&);

		size_t get_MembersCount(const Role&) const;
	};

} // namespace wtoken::vault
