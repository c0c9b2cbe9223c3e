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

#include "access_control.h"

namespace wtoken::vault
{
	const Role& Roles::DefaultAdmin()
	{
		static const Role s_Role = Zero;
		return s_Role;
	}

	const Role& Roles::Pause()
	{
		static const Role s_Role = Eth::HashOf("PAUSE_ROLE");
		return s_Role;
	}

	const Role& Roles::Upgrade()
	{
		static const Role s_Role = Eth::HashOf("UPGRADE_ROLE");
		return s_Role;
	}

	void IAccessController::RequireRole(const Role& role, const Address& account) const
	{
		if (!HasRole(role, account))
			throw UnauthorizedException(account, role);
	}

	bool RoleTable::HasRole(const Role& role, const Address& account) const
	{
		auto it = m_Roles.find(role);
		return (m_Roles.end() != it) && it->second.m_Members.count(account);
	}

	const Role& RoleTable::get_RoleAdmin(const Role& role) const
	{
		auto it = m_Roles.find(role);
		return (m_Roles.end() == it) ? Roles::DefaultAdmin() : it->second.m_Admin;
	}

	void RoleTable::SetRoleAdmin(const Role& role, const Role& admin)
	{
		m_Roles[role].m_Admin = admin;
	}

	bool RoleTable::Grant(const Role& role, const Address& account)
	{
		return m_Roles[role].m_Members.insert(account).second;
	}

	bool RoleTable::Revoke(const Role& role, const Address& account)
	{
		auto it = m_Roles.find(role);
		return (m_Roles.end() != it) && it->second.m_Members.erase(account);
	}

	size_t RoleTable::get_MembersCount(const Role& role) const
	{
		auto it = m_Roles.find(role);
		return (m_Roles.end() == it) ? 0 : it->second.m_Members.size();
	}

} // namespace wtoken::vault
