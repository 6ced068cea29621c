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

#pragma once

#include <granary/farm/config.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

GRANARY_FARM_NAMESPACE_BEGIN

enum class FarmError
{
    Success = 0,
    InternalError,
    InvalidInput,
    InvalidConfig,
    AccountNotRegistered,
    AccountExists,
    UnknownToken,
    UnknownCollection,
    UnknownItem,
    ItemAlreadyStaked,
    BoostAlreadyStaked,
    NoBoostStaked,
    WrongStakeKind,
    FarmNotActive,
    FarmPaused,
    SetupFinalized,
    SetupNotFinalized,
    WrongDeposit,
    DepositMissing,
    FinalizeTooLate,
    InvalidSchedule,
    PermissionDenied,
    NothingToWithdraw,
    InsufficientStake,
    InsufficientAccrual,
    InsufficientItemDeposit,
    RemoteCallFailure,
    PartialSettlementFailure,
    SettlementPending,
};

GRANARY_FARM_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<granary::farm::FarmError>
    : quick_status_code_from_enum_defaults<granary::farm::FarmError>
{
    static constexpr auto const domain_name = "Farm Error";
    static constexpr auto const domain_uuid =
        "8d3b5f2e-61a4-4c7d-b0e9-4f1a7c2d9e56";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
