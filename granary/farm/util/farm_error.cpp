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

#include <granary/farm/util/farm_error.hpp>

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

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<granary::farm::FarmError>::mapping> const &
quick_status_code_from_enum<granary::farm::FarmError>::value_mappings()
{
    using granary::farm::FarmError;

    static std::initializer_list<mapping> const v = {
        {FarmError::Success, "success", {errc::success}},
        {FarmError::InternalError, "internal error", {}},
        {FarmError::InvalidInput, "invalid input", {}},
        {FarmError::InvalidConfig, "invalid farm config", {}},
        {FarmError::AccountNotRegistered, "account not registered", {}},
        {FarmError::AccountExists, "account already registered", {}},
        {FarmError::UnknownToken, "unknown token", {}},
        {FarmError::UnknownCollection, "unknown collection", {}},
        {FarmError::UnknownItem, "item not staked", {}},
        {FarmError::ItemAlreadyStaked, "item already staked", {}},
        {FarmError::BoostAlreadyStaked,
         "account already has a boost staked",
         {}},
        {FarmError::NoBoostStaked, "account has no boost staked", {}},
        {FarmError::WrongStakeKind, "wrong stake kind for this farm", {}},
        {FarmError::FarmNotActive, "farm not active", {}},
        {FarmError::FarmPaused, "farm paused", {}},
        {FarmError::SetupFinalized, "setup already finalized", {}},
        {FarmError::SetupNotFinalized, "setup not finalized", {}},
        {FarmError::WrongDeposit, "wrong setup deposit", {}},
        {FarmError::DepositMissing, "setup deposit missing", {}},
        {FarmError::FinalizeTooLate,
         "setup must be finalized before farming starts",
         {}},
        {FarmError::InvalidSchedule, "invalid farming schedule", {}},
        {FarmError::PermissionDenied, "caller is not the owner", {}},
        {FarmError::NothingToWithdraw, "nothing to withdraw", {}},
        {FarmError::InsufficientStake, "insufficient stake", {}},
        {FarmError::InsufficientAccrual, "nothing accrued to harvest", {}},
        {FarmError::InsufficientItemDeposit,
         "item deposit does not cover one more item",
         {}},
        {FarmError::RemoteCallFailure, "remote call failed", {}},
        {FarmError::PartialSettlementFailure,
         "one or more settlement legs failed",
         {}},
        {FarmError::SettlementPending, "settlement still pending", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
