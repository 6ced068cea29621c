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

#include <granary/core/int.hpp>
#include <granary/core/likely.h>
#include <granary/core/result.hpp>
#include <granary/farm/config.hpp>
#include <granary/farm/farm_config.hpp>
#include <granary/farm/util/constants.hpp>
#include <granary/farm/util/farm_error.hpp>

#include <quill/Quill.h>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

GRANARY_FARM_ANONYMOUS_NAMESPACE_BEGIN

template <typename T>
bool has_unique_ids(std::vector<T> const &entries)
{
    std::set<std::string> seen;
    for (auto const &entry : entries) {
        if (!seen.insert(entry.id).second) {
            return false;
        }
    }
    return true;
}

// 256 bit amounts travel as decimal strings; small values may be plain
// numbers
uint256_t parse_amount(nlohmann::json const &j)
{
    if (j.is_string()) {
        return intx::from_string<uint256_t>(j.get<std::string>().c_str());
    }
    return uint256_t{j.get<uint64_t>()};
}

std::vector<TokenRate> parse_token_rates(nlohmann::json const &j)
{
    std::vector<TokenRate> rates;
    for (auto const &entry : j) {
        TokenRate rate{.id = entry.at("id").get<std::string>()};
        if (entry.contains("rate")) {
            rate.rate = parse_amount(entry.at("rate"));
        }
        rates.push_back(std::move(rate));
    }
    return rates;
}

StakeKind parse_stake_kind(std::string const &s)
{
    if (s == "fungible") {
        return StakeKind::Fungible;
    }
    if (s == "non_fungible") {
        return StakeKind::NonFungible;
    }
    throw std::invalid_argument{"unknown stake_kind " + s};
}

GRANARY_FARM_ANONYMOUS_NAMESPACE_END

GRANARY_FARM_NAMESPACE_BEGIN

uint256_t FarmConfig::reward_per_round() const
{
    if (GRANARY_UNLIKELY(rounds_total == 0)) {
        return 0;
    }
    return total_reward_supply / rounds_total;
}

uint64_t FarmConfig::farming_end() const
{
    return farming_start + rounds_total * round_duration;
}

std::optional<size_t> FarmConfig::stake_token_index(TokenId const &id) const
{
    for (size_t i = 0; i < stake_tokens.size(); ++i) {
        if (stake_tokens[i].id == id) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<size_t> FarmConfig::reward_token_index(TokenId const &id) const
{
    for (size_t i = 0; i < reward_tokens.size(); ++i) {
        if (reward_tokens[i].id == id) {
            return i;
        }
    }
    return std::nullopt;
}

CollectionWeight const *
FarmConfig::find_collection(CollectionId const &id) const
{
    for (auto const &c : collections) {
        if (c.id == id) {
            return &c;
        }
    }
    return nullptr;
}

BoostCollection const *
FarmConfig::find_boost_collection(CollectionId const &id) const
{
    for (auto const &c : boost_collections) {
        if (c.id == id) {
            return &c;
        }
    }
    return nullptr;
}

Result<void> validate(FarmConfig const &config)
{
    if (GRANARY_UNLIKELY(
            config.owner.empty() || config.reward_tokens.empty())) {
        return FarmError::InvalidConfig;
    }
    if (GRANARY_UNLIKELY(
            config.rounds_total == 0 || config.round_duration == 0)) {
        return FarmError::InvalidConfig;
    }
    // every round emits the same amount and the deposits have to add up to
    // the supply exactly
    if (GRANARY_UNLIKELY(
            config.total_reward_supply == 0 ||
            config.total_reward_supply % config.rounds_total != 0)) {
        return FarmError::InvalidConfig;
    }
    if (GRANARY_UNLIKELY(config.fee_rate > BASIS_POINTS)) {
        return FarmError::InvalidConfig;
    }
    switch (config.stake_kind) {
    case StakeKind::Fungible:
        if (config.stake_tokens.empty() || !config.collections.empty()) {
            return FarmError::InvalidConfig;
        }
        break;
    case StakeKind::NonFungible:
        if (config.collections.empty() || !config.stake_tokens.empty()) {
            return FarmError::InvalidConfig;
        }
        break;
    }
    if (!has_unique_ids(config.stake_tokens) ||
        !has_unique_ids(config.reward_tokens) ||
        !has_unique_ids(config.collections) ||
        !has_unique_ids(config.boost_collections)) {
        return FarmError::InvalidConfig;
    }
    for (auto const &t : config.stake_tokens) {
        if (t.rate == 0) {
            return FarmError::InvalidConfig;
        }
    }
    for (auto const &t : config.reward_tokens) {
        if (t.rate == 0) {
            return FarmError::InvalidConfig;
        }
    }
    for (auto const &c : config.collections) {
        if (c.weight == 0) {
            return FarmError::InvalidConfig;
        }
    }
    if (config.item_deposit.has_value() &&
        (config.stake_kind != StakeKind::NonFungible ||
         config.item_deposit->id.empty() || config.item_deposit->rate == 0)) {
        return FarmError::InvalidConfig;
    }
    uint64_t const duration = config.rounds_total * config.round_duration;
    if (duration / config.rounds_total != config.round_duration ||
        config.farming_start + duration < config.farming_start) {
        return FarmError::InvalidConfig;
    }
    return outcome::success();
}

Result<FarmConfig> parse_farm_config(nlohmann::json const &j)
{
    FarmConfig config;
    try {
        config.owner = j.at("owner").get<std::string>();
        config.treasury = j.value("treasury", config.owner);
        config.stake_kind =
            parse_stake_kind(j.value("stake_kind", std::string{"fungible"}));
        if (j.contains("stake_tokens")) {
            config.stake_tokens = parse_token_rates(j.at("stake_tokens"));
        }
        if (j.contains("collections")) {
            for (auto const &entry : j.at("collections")) {
                CollectionWeight c{.id = entry.at("id").get<std::string>()};
                if (entry.contains("weight")) {
                    c.weight = parse_amount(entry.at("weight"));
                }
                config.collections.push_back(std::move(c));
            }
        }
        if (j.contains("boost_collections")) {
            for (auto const &entry : j.at("boost_collections")) {
                config.boost_collections.push_back(BoostCollection{
                    .id = entry.at("id").get<std::string>(),
                    .boost_bp = entry.at("boost_bp").get<uint64_t>()});
            }
        }
        config.reward_tokens = parse_token_rates(j.at("reward_tokens"));
        if (j.contains("item_deposit")) {
            auto const &entry = j.at("item_deposit");
            config.item_deposit = TokenRate{
                .id = entry.at("id").get<std::string>(),
                .rate = parse_amount(entry.at("rate"))};
        }
        config.fee_rate = j.value("fee_rate", uint64_t{0});
        config.total_reward_supply =
            parse_amount(j.at("total_reward_supply"));
        config.rounds_total = j.at("rounds_total").get<uint64_t>();
        config.round_duration =
            j.value("round_duration", DEFAULT_ROUND_DURATION);
        config.farming_start = j.at("farming_start").get<uint64_t>();
    }
    catch (nlohmann::json::exception const &e) {
        LOG_ERROR("malformed farm config: {}", e.what());
        return FarmError::InvalidConfig;
    }
    catch (std::logic_error const &e) {
        LOG_ERROR("malformed farm config: {}", e.what());
        return FarmError::InvalidConfig;
    }
    BOOST_OUTCOME_TRY(validate(config));
    return config;
}

Result<FarmConfig> load_farm_config(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (GRANARY_UNLIKELY(!in)) {
        LOG_ERROR("unable to open farm config {}", path.string());
        return FarmError::InvalidConfig;
    }
    nlohmann::json j;
    try {
        in >> j;
    }
    catch (nlohmann::json::exception const &e) {
        LOG_ERROR("farm config {} is not json: {}", path.string(), e.what());
        return FarmError::InvalidConfig;
    }
    return parse_farm_config(j);
}

GRANARY_FARM_NAMESPACE_END
