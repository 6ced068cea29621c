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

#include <granary/core/basic_formatter.hpp>
#include <granary/core/fmt/int_fmt.hpp>
#include <granary/core/int.hpp>
#include <granary/core/likely.h>
#include <granary/core/log_level_map.hpp>
#include <granary/core/result.hpp>
#include <granary/core/task/task_queue.hpp>
#include <granary/farm/clock.hpp>
#include <granary/farm/farm_config.hpp>
#include <granary/farm/farm_controller.hpp>
#include <granary/farm/local_registry.hpp>
#include <granary/farm/settlement.hpp>
#include <granary/farm/token_registry.hpp>
#include <granary/farm/util/farm_error.hpp>
#include <granary/farm/util/types.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <intx/intx.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace granary;
using namespace granary::farm;

namespace
{
    using json = nlohmann::json;

    // In process world the farm settles against: one registry per token and
    // collection named by the config, all holding the farm's custody account.
    class Simulation
    {
        task::TaskQueue queue_;
        ManualClock clock_;
        std::map<TokenId, std::unique_ptr<LocalTokenRegistry>> tokens_;
        std::map<CollectionId, std::unique_ptr<LocalItemRegistry>> items_;
        RegistryDirectory registries_;
        std::vector<SettlementTicket> settlements_;
        std::unique_ptr<FarmController> controller_;

        void add_token(TokenId const &id, AccountId const &custody)
        {
            if (tokens_.contains(id)) {
                return;
            }
            auto registry =
                std::make_unique<LocalTokenRegistry>(queue_, id, custody);
            registries_.tokens[id] = registry.get();
            tokens_.emplace(id, std::move(registry));
        }

        void add_collection(CollectionId const &id, AccountId const &custody)
        {
            if (items_.contains(id)) {
                return;
            }
            auto registry =
                std::make_unique<LocalItemRegistry>(queue_, id, custody);
            registries_.collections[id] = registry.get();
            items_.emplace(id, std::move(registry));
        }

        LocalTokenRegistry *token(TokenId const &id)
        {
            auto const it = tokens_.find(id);
            return it == tokens_.end() ? nullptr : it->second.get();
        }

        LocalItemRegistry *collection(CollectionId const &id)
        {
            auto const it = items_.find(id);
            return it == items_.end() ? nullptr : it->second.get();
        }

        Result<void> track(Result<SettlementReceipt> const &receipt)
        {
            if (receipt.has_error()) {
                return receipt.error().clone();
            }
            if (receipt.value().settlement) {
                settlements_.push_back(receipt.value().settlement);
            }
            return outcome::success();
        }

        Result<void> stake(json const &step, bool item_deposit);
        Result<void> stake_item(json const &step, bool boost);
        Result<void> set_available(json const &step);
        json status(AccountId const &) const;
        json params() const;

    public:
        Simulation(
            FarmConfig config, uint64_t const start_time,
            AccountId const &custody)
            : clock_{start_time}
        {
            for (auto const &t : config.stake_tokens) {
                add_token(t.id, custody);
            }
            for (auto const &t : config.reward_tokens) {
                add_token(t.id, custody);
            }
            if (config.item_deposit.has_value()) {
                add_token(config.item_deposit->id, custody);
            }
            for (auto const &c : config.collections) {
                add_collection(c.id, custody);
            }
            for (auto const &c : config.boost_collections) {
                add_collection(c.id, custody);
            }
            controller_ = std::make_unique<FarmController>(
                std::move(config), queue_, registries_, clock_);
        }

        json run_step(json const &step);
    };

    std::string to_string(uint256_t const &v)
    {
        return intx::to_string(v);
    }

    json to_json(std::vector<uint256_t> const &amounts)
    {
        json out = json::array();
        for (auto const &amount : amounts) {
            out.push_back(to_string(amount));
        }
        return out;
    }

    uint256_t parse_amount(json const &j)
    {
        if (j.is_number_unsigned()) {
            return uint256_t{j.get<uint64_t>()};
        }
        return intx::from_string<uint256_t>(j.get<std::string>().c_str());
    }

    char const *to_string(FarmPhase const phase)
    {
        switch (phase) {
        case FarmPhase::Setup:
            return "setup";
        case FarmPhase::Active:
            return "active";
        case FarmPhase::Closed:
            return "closed";
        }
        return "unknown";
    }

    json to_json(Result<void> const &res)
    {
        if (res.has_error()) {
            return res.error().message().c_str();
        }
        return "ok";
    }

    Result<void> Simulation::stake(json const &step, bool const item_deposit)
    {
        auto const account = step.at("account").get<std::string>();
        auto const id = step.at("token").get<std::string>();
        auto const amount = parse_amount(step.at("amount"));
        auto *const registry = token(id);
        if (GRANARY_UNLIKELY(registry == nullptr)) {
            return FarmError::UnknownToken;
        }
        // the account brings its own tokens into the farm's custody
        registry->mint(account, amount);
        BOOST_OUTCOME_TRY(
            registry->transfer(account, registry->custody(), amount));
        return item_deposit ? controller_->deposit_for_items(account, amount)
                            : controller_->stake(account, id, amount);
    }

    Result<void> Simulation::stake_item(json const &step, bool const boost)
    {
        auto const account = step.at("account").get<std::string>();
        StakedItem const item{
            step.at("collection").get<std::string>(),
            step.at("item").get<std::string>()};
        auto *const registry = collection(item.collection);
        if (GRANARY_UNLIKELY(registry == nullptr)) {
            return FarmError::UnknownCollection;
        }
        auto const *const owner = registry->owner_of(item.item);
        if (owner == nullptr) {
            registry->mint(account, item.item);
        }
        BOOST_OUTCOME_TRY(
            registry->transfer(account, registry->custody(), item.item));
        return boost ? controller_->stake_boost(account, item)
                     : controller_->stake_item(account, item);
    }

    Result<void> Simulation::set_available(json const &step)
    {
        auto const id = step.at("registry").get<std::string>();
        bool const available = step.at("available").get<bool>();
        if (auto *const t = token(id)) {
            t->set_available(available);
            return outcome::success();
        }
        if (auto *const c = collection(id)) {
            c->set_available(available);
            return outcome::success();
        }
        return FarmError::InvalidInput;
    }

    json Simulation::status(AccountId const &account) const
    {
        auto const res = controller_->status(account);
        if (res.has_error()) {
            return json{{"error", res.error().message().c_str()}};
        }
        if (!res.value().has_value()) {
            return nullptr;
        }
        auto const &s = *res.value();
        json items = json::object();
        for (auto const &[collection, ids] : s.staked_items) {
            items[collection] = ids;
        }
        json out{
            {"weight", to_string(s.weight)},
            {"accrued_units", to_string(s.accrued_units)},
            {"farmed_tokens", to_json(s.farmed_tokens)},
            {"staked_amounts", to_json(s.staked_amounts)},
            {"staked_items", std::move(items)},
            {"item_deposit", to_string(s.item_deposit)},
            {"recovered", to_json(s.recovered)},
            {"round_timestamp", s.round_timestamp}};
        if (s.boost_item.has_value()) {
            out["boost_item"] =
                s.boost_item->collection + ":" + s.boost_item->item;
        }
        return out;
    }

    json Simulation::params() const
    {
        auto const p = controller_->params();
        return json{
            {"phase", to_string(p.phase)},
            {"is_active", p.is_active},
            {"farming_start", p.farming_start},
            {"farming_end", p.farming_end},
            {"reward_per_round", to_string(p.reward_per_round)},
            {"total_weight", to_string(p.total_weight)},
            {"last_checkpoint_round", p.last_checkpoint_round},
            {"farm_deposits", to_json(p.farm_deposits)},
            {"total_harvested", to_json(p.total_harvested)},
            {"total_staked", to_json(p.total_staked)},
            {"fee_collected", to_json(p.fee_collected)},
            {"total_items", p.total_items},
            {"total_boosts", p.total_boosts},
            {"total_item_deposit", to_string(p.total_item_deposit)},
            {"accounts_registered", p.accounts_registered}};
    }

    json Simulation::run_step(json const &step)
    {
        if (step.contains("time")) {
            clock_.set(step.at("time").get<uint64_t>());
        }
        auto const op = step.at("op").get<std::string>();
        json out{{"op", op}, {"time", clock_.now()}};
        size_t const settled = settlements_.size();

        Result<void> res = outcome::success();
        if (op == "register") {
            auto const account = step.at("account").get<std::string>();
            res = controller_->register_account(account);
            for (auto &[id, registry] : tokens_) {
                registry->register_account(account);
            }
        }
        else if (op == "setup_deposit") {
            res = controller_->setup_deposit(
                step.at("token").get<std::string>(),
                parse_amount(step.at("amount")));
        }
        else if (op == "finalize_setup") {
            res = controller_->finalize_setup(
                step.at("caller").get<std::string>());
        }
        else if (op == "set_active") {
            res = controller_->set_active(
                step.at("caller").get<std::string>(),
                step.at("active").get<bool>());
        }
        else if (op == "set_farming_start") {
            res = controller_->set_farming_start(
                step.at("caller").get<std::string>(),
                step.at("start").get<uint64_t>());
        }
        else if (op == "withdraw_fees") {
            res = track(controller_->withdraw_fees(
                step.at("caller").get<std::string>()));
        }
        else if (op == "stake") {
            res = stake(step, false);
        }
        else if (op == "deposit_for_items") {
            res = stake(step, true);
        }
        else if (op == "stake_item") {
            res = stake_item(step, false);
        }
        else if (op == "stake_boost") {
            res = stake_item(step, true);
        }
        else if (op == "unstake") {
            res = track(controller_->unstake(
                step.at("account").get<std::string>(),
                step.at("token").get<std::string>(),
                parse_amount(step.at("amount"))));
        }
        else if (op == "unstake_items") {
            std::optional<ItemId> item;
            if (step.contains("item")) {
                item = step.at("item").get<std::string>();
            }
            res = track(controller_->unstake_items(
                step.at("account").get<std::string>(),
                step.at("collection").get<std::string>(),
                item));
        }
        else if (op == "unstake_boost") {
            res = track(controller_->unstake_boost(
                step.at("account").get<std::string>()));
        }
        else if (op == "harvest") {
            res = track(
                controller_->harvest(step.at("account").get<std::string>()));
        }
        else if (op == "close") {
            res =
                track(controller_->close(step.at("account").get<std::string>()));
        }
        else if (op == "set_available") {
            res = set_available(step);
        }
        else if (op == "status") {
            out["status"] = status(step.at("account").get<std::string>());
        }
        else if (op == "params") {
            out["params"] = params();
        }
        else if (op == "balance") {
            auto *const registry = token(step.at("token").get<std::string>());
            if (registry == nullptr) {
                res = FarmError::UnknownToken;
            }
            else {
                out["balance"] = to_string(
                    registry->balance_of(step.at("account").get<std::string>()));
            }
        }
        else {
            LOG_ERROR("unknown scenario op '{}'", op);
            res = FarmError::InvalidInput;
        }
        out["result"] = to_json(res);

        // every remote call completes before the next step
        out["tasks"] = queue_.run();
        if (settlements_.size() > settled) {
            json outcomes = json::array();
            for (size_t i = settled; i < settlements_.size(); ++i) {
                outcomes.push_back(to_json(settlements_[i]->outcome()));
            }
            out["settlements"] = std::move(outcomes);
        }
        return out;
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"granary_sim"};
    cli.option_defaults()->always_capture_default();

    std::filesystem::path config_path{};
    std::filesystem::path scenario_path{};
    std::string custody{"farm"};
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--config", config_path, "farm config json")->required();
    cli.add_option("--scenario", scenario_path, "scenario json")->required();
    cli.add_option("--custody", custody, "account holding staked assets");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::RequiredError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    auto config = load_farm_config(config_path);
    if (GRANARY_UNLIKELY(config.has_error())) {
        LOG_ERROR(
            "unable to load {}: {}",
            config_path.string(),
            config.error().message().c_str());
        return EXIT_FAILURE;
    }
    if (auto const res = validate(config.value());
        GRANARY_UNLIKELY(res.has_error())) {
        LOG_ERROR(
            "invalid farm config {}: {}",
            config_path.string(),
            res.error().message().c_str());
        return EXIT_FAILURE;
    }

    json scenario;
    {
        std::ifstream in{scenario_path};
        if (GRANARY_UNLIKELY(!in)) {
            LOG_ERROR("unable to open scenario {}", scenario_path.string());
            return EXIT_FAILURE;
        }
        try {
            in >> scenario;
        }
        catch (json::exception const &e) {
            LOG_ERROR(
                "scenario {} is not json: {}", scenario_path.string(), e.what());
            return EXIT_FAILURE;
        }
    }

    try {
        Simulation sim{
            std::move(config).value(),
            scenario.value("start_time", uint64_t{0}),
            custody};
        auto const &steps = scenario.at("steps");
        LOG_INFO(
            "replaying {} steps of {}", steps.size(), scenario_path.string());
        for (auto const &step : steps) {
            std::cout << sim.run_step(step).dump() << std::endl;
        }
    }
    catch (json::exception const &e) {
        LOG_ERROR("malformed scenario step: {}", e.what());
        return EXIT_FAILURE;
    }
    catch (std::logic_error const &e) {
        LOG_ERROR("malformed amount in scenario: {}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
