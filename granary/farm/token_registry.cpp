// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <granary/farm/config.hpp>
#include <granary/farm/token_registry.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

GRANARY_FARM_NAMESPACE_BEGIN

FungibleRegistry *RegistryDirectory::find_token(TokenId const &id) const
{
    auto const it = tokens.find(id);
    return it == tokens.end() ? nullptr : it->second;
}

ItemRegistry *RegistryDirectory::find_collection(CollectionId const &id) const
{
    auto const it = collections.find(id);
    return it == collections.end() ? nullptr : it->second;
}

GRANARY_FARM_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<granary::farm::RegistryError>::mapping> const &
quick_status_code_from_enum<granary::farm::RegistryError>::value_mappings()
{
    using granary::farm::RegistryError;

    static std::initializer_list<mapping> const v = {
        {RegistryError::Success, "success", {errc::success}},
        {RegistryError::ReceiverNotRegistered, "receiver not registered", {}},
        {RegistryError::InsufficientBalance, "insufficient balance", {}},
        {RegistryError::ItemNotHeld, "item not held by sender", {}},
        {RegistryError::Unavailable, "registry unavailable", {}},
        {RegistryError::NoRegistry, "no registry for token", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
