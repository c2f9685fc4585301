/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/exchange/Exchange.hpp"

#include "derivsim/margin/MarginCalculator.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

namespace
{

template<typename Range, typename Fn>
rapidjson::Value serializeArray(
    const Range& items, rapidjson::Document::AllocatorType& allocator, Fn&& serializeItem)
{
    rapidjson::Value array{rapidjson::kArrayType};
    for (const auto& item : items) {
        rapidjson::Document itemJson{&allocator};
        serializeItem(item, itemJson);
        array.PushBack(itemJson, allocator);
    }
    return array;
}

rapidjson::Value serializeResults(
    const auto& results, rapidjson::Document::AllocatorType& allocator)
{
    return serializeArray(
        results, allocator, [](const auto& result, rapidjson::Document& json) {
            result.jsonSerialize(json);
        });
}

void serializeUser(
    const position::User& user,
    const position::Position* position,
    decimal_t markPrice,
    rapidjson::Document& json)
{
    json.SetObject();
    auto& allocator = json.GetAllocator();
    const decimal_t pnl = position != nullptr ? position->unrealizedPnL(markPrice) : 0_dec;
    json.AddMember("id", rapidjson::Value{user.id().c_str(), allocator}, allocator);
    json.AddMember("name", rapidjson::Value{user.name().c_str(), allocator}, allocator);
    json.AddMember("totalBalance", json::decimalValue(user.totalBalance()), allocator);
    json.AddMember("availableBalance", json::decimalValue(user.availableBalance()), allocator);
    json.AddMember("usedMargin", json::decimalValue(user.usedMargin()), allocator);
    json.AddMember("unrealizedPnL", json::decimalValue(pnl), allocator);
    json.AddMember("realizedPnL", json::decimalValue(user.realizedPnL()), allocator);
    json.AddMember("equity", json::decimalValue(user.totalBalance() + pnl), allocator);
    json.AddMember("leverage", json::decimalValue(user.leverage()), allocator);
    json.AddMember(
        "marginRatio",
        json::decimalValue(
            margin::marginRatio(user.availableBalance(), pnl, user.usedMargin())),
        allocator);
    json.AddMember("hasPosition", rapidjson::Value{position != nullptr}, allocator);
}

}  // namespace

//-------------------------------------------------------------------------

Exchange::Exchange(ExchangeConfig config)
    : m_config{std::move(config)},
      m_validator{m_config.riskLimits},
      m_state{std::make_unique<ExchangeState>(m_config)}
{
    m_zeroSum = checkZeroSum(*m_state);
}

//-------------------------------------------------------------------------

CommandResult Exchange::process(const Command& command)
{
    const auto type = commandType(command);
    ++m_state->timestamp;

    auto result = [&] {
        try {
            return std::visit([this](const auto& cmd) { return handle(cmd); }, command);
        }
        catch (const NotFoundError& e) {
            return CommandResult::failure(type, e.what());
        }
        catch (const std::invalid_argument& e) {
            return CommandResult::failure(type, e.what());
        }
    }();

    if (!result.success) {
        logDebug("{} | {} FAILED: {}", m_state->timestamp, type, result.error.value_or(""));
    }
    if (m_attachState && result.state.IsNull()) {
        jsonSerialize(result.state);
    }
    return result;
}

//-------------------------------------------------------------------------

CommandResult Exchange::process(const std::string& message)
{
    Command command;
    try {
        const auto json = json::str2json(message);
        command = CommandFactory::fromJson(json);
    }
    catch (const UnknownCommandError& e) {
        return CommandResult::failure("unknown", e.what());
    }
    catch (const std::invalid_argument& e) {
        return CommandResult::failure("invalid", e.what());
    }
    return process(command);
}

//-------------------------------------------------------------------------

void Exchange::setDebug(bool flag) noexcept
{
    DebugLogger::setDebug(flag);
    m_state->setDebug(flag);
}

//-------------------------------------------------------------------------

void Exchange::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        const auto& state = *m_state;
        const decimal_t mark = state.markPrice;

        json.AddMember("timestamp", rapidjson::Value{state.timestamp}, allocator);
        json.AddMember("markPrice", json::decimalValue(mark), allocator);
        json.AddMember("indexPrice", json::decimalValue(state.indexPrice), allocator);
        json.AddMember("fundingRate", json::decimalValue(state.fundingRate), allocator);
        json.AddMember("liquidationEnabled", rapidjson::Value{state.liquidationEnabled}, allocator);
        json.AddMember("adlEnabled", rapidjson::Value{state.adlEnabled}, allocator);

        json.AddMember(
            "users",
            serializeArray(
                state.users | views::values,
                allocator,
                [&](const position::User& user, rapidjson::Document& userJson) {
                    serializeUser(user, state.ledger.find(user.id()), mark, userJson);
                }),
            allocator);
        json.AddMember(
            "positions",
            serializeArray(
                state.ledger.positions() | views::values,
                allocator,
                [&](const position::Position& position, rapidjson::Document& positionJson) {
                    position.jsonSerialize(positionJson, mark);
                }),
            allocator);
        state.book.snapshot(m_config.bookDepth).jsonSerialize(json, "orderBook");
        json.AddMember("trades", serializeResults(state.tradeHistory, allocator), allocator);
        state.insuranceFund.jsonSerialize(json, "insuranceFund");
        json.AddMember(
            "liquidationPositions",
            serializeArray(
                state.inventory.positions(),
                allocator,
                [&](const liquidation::EnginePosition& position, rapidjson::Document& positionJson) {
                    position.jsonSerialize(positionJson, mark);
                }),
            allocator);

        rapidjson::Document engineJson{&allocator};
        engineJson.SetObject();
        state.inventory.summary(mark).jsonSerialize(engineJson, "summary");
        state.inventory.checkInsuranceFundSufficiency(mark, state.insuranceFund.balance())
            .jsonSerialize(engineJson, "insuranceFundSufficiency");
        json.AddMember("liquidationEngine", engineJson, allocator);

        state.marginMonitor.jsonSerialize(json, "marginCalls");
        state.adlEngine.adlQueue(state.ledger, state.users, mark).jsonSerialize(json, "adlQueue");
        checkZeroSum(state).jsonSerialize(json, "zeroSum");
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

CommandResult Exchange::handle(const PlaceOrder& cmd)
{
    auto& state = *m_state;

    const auto validation = m_validator.validate(cmd, state.users, state.ledger, state.book);
    if (!validation) {
        auto result = CommandResult::failure(
            PlaceOrder::kType, fmt::format("Order rejected: {}", validation.error()));
        result.data.AddMember(
            "errorCode",
            rapidjson::Value{OrderErrorCode2StrView(validation.error()).data(), result.data.GetAllocator()},
            result.data.GetAllocator());
        return result;
    }

    auto order = cmd.orderType == book::OrderType::LIMIT
        ? state.book.orderFactory().makeLimitOrder(
            state.timestamp, cmd.userId, cmd.side, cmd.size, *cmd.price, validation->leverage)
        : state.book.orderFactory().makeMarketOrder(
            state.timestamp, cmd.userId, cmd.side, cmd.size, validation->leverage);
    m_signals.orderPlaced(*order);

    const auto match = state.matchingEngine.match(order, state.book, state.timestamp);

    for (const auto& cancelled : match.selfTradeCancellations) {
        m_signals.orderCancelled(*cancelled, state.timestamp);
    }
    for (const auto& trade : match.trades) {
        applyTrade(trade);
    }

    const auto liquidations = runLiquidations();
    updateMarginCalls();
    verifyInvariants();

    const decimal_t filledSize = match.filledSize();
    const std::string_view status = [&] {
        if (match.restingOrder) return filledSize > 0_dec ? "PARTIALLY_FILLED" : "OPEN";
        if (match.discardedSize > 0_dec) return filledSize > 0_dec ? "PARTIALLY_FILLED" : "CANCELLED";
        return "FILLED";
    }();

    CommandResult result{true, PlaceOrder::kType};
    auto& data = result.data;
    auto& allocator = data.GetAllocator();
    data.AddMember("orderId", rapidjson::Value{order->id()}, allocator);
    data.AddMember("status", rapidjson::Value{status.data(), allocator}, allocator);
    order->jsonSerialize(data, "order");
    data.AddMember("filledSize", json::decimalValue(filledSize), allocator);
    data.AddMember("discardedSize", json::decimalValue(match.discardedSize), allocator);
    data.AddMember("trades", serializeResults(match.trades, allocator), allocator);
    rapidjson::Value cancelledJson{rapidjson::kArrayType};
    for (const auto& cancelled : match.selfTradeCancellations) {
        cancelledJson.PushBack(rapidjson::Value{cancelled->id()}, allocator);
    }
    data.AddMember("selfTradeCancellations", cancelledJson, allocator);
    data.AddMember("liquidations", serializeResults(liquidations, allocator), allocator);
    return result;
}

//-------------------------------------------------------------------------

CommandResult Exchange::handle(const CancelOrder& cmd)
{
    auto& state = *m_state;

    const auto order = state.book.getOrder(cmd.orderId);
    if (!order) {
        throw NotFoundError{fmt::format(
            "{}: No resting order #{}",
            std::source_location::current().function_name(),
            cmd.orderId)};
    }
    if (cmd.userId && *cmd.userId != (*order)->userId()) {
        return CommandResult::failure(
            CancelOrder::kType,
            fmt::format("Order #{} does not belong to '{}'", cmd.orderId, *cmd.userId));
    }

    state.book.remove(cmd.orderId);
    m_signals.orderCancelled(**order, state.timestamp);
    logDebug("{} | CANCELLED ORDER #{}", state.timestamp, cmd.orderId);

    CommandResult result{true, CancelOrder::kType};
    result.data.AddMember("orderId", rapidjson::Value{cmd.orderId}, result.data.GetAllocator());
    (*order)->jsonSerialize(result.data, "order");
    return result;
}

//-------------------------------------------------------------------------

CommandResult Exchange::handle(const UpdateMarkPrice& cmd)
{
    auto& state = *m_state;

    if (!util::isFinite(cmd.price) || cmd.price <= 0_dec) {
        return CommandResult::failure(
            UpdateMarkPrice::kType, fmt::format("Mark price must be positive, was {}", cmd.price));
    }

    const decimal_t previous = state.markPrice;
    state.markPrice = cmd.price;
    state.indexPrice = cmd.price;
    m_signals.markPrice(cmd.price, state.timestamp);
    logDebug("{} | MARK PRICE {} -> {}", state.timestamp, previous, cmd.price);

    const auto candidates = state.liquidationEngine.detect(state.ledger, state.markPrice);
    const auto liquidations = runLiquidations();

    std::vector<adl::ADLResult> adlResults;
    if (state.adlEnabled && !state.inventory.empty()) {
        const auto sufficiency = state.inventory.checkInsuranceFundSufficiency(
            state.markPrice, state.insuranceFund.balance());
        if (!sufficiency.sufficient) {
            spdlog::warn(
                "Insurance fund {} cannot cover engine exposure {} at mark {}, running ADL",
                sufficiency.fundBalance, sufficiency.exposure, state.markPrice);
            adlResults = runADL();
        }
    }

    updateMarginCalls();
    verifyInvariants();

    CommandResult result{true, UpdateMarkPrice::kType};
    auto& data = result.data;
    auto& allocator = data.GetAllocator();
    data.AddMember("previousMarkPrice", json::decimalValue(previous), allocator);
    data.AddMember("markPrice", json::decimalValue(state.markPrice), allocator);
    data.AddMember("candidates", serializeResults(candidates, allocator), allocator);
    data.AddMember("liquidations", serializeResults(liquidations, allocator), allocator);
    data.AddMember("adl", serializeResults(adlResults, allocator), allocator);
    return result;
}

//-------------------------------------------------------------------------

CommandResult Exchange::handle(const DetectLiquidations&)
{
    const auto& state = *m_state;
    const auto candidates = state.liquidationEngine.detect(state.ledger, state.markPrice);

    CommandResult result{true, DetectLiquidations::kType};
    auto& allocator = result.data.GetAllocator();
    result.data.AddMember("markPrice", json::decimalValue(state.markPrice), allocator);
    result.data.AddMember("candidates", serializeResults(candidates, allocator), allocator);
    return result;
}

//-------------------------------------------------------------------------

CommandResult Exchange::handle(const ManualLiquidate& cmd)
{
    auto& state = *m_state;

    auto user = state.findUser(cmd.userId);
    if (user == nullptr) {
        throw NotFoundError{fmt::format(
            "{}: Unknown user '{}'", std::source_location::current().function_name(), cmd.userId)};
    }
    if (!state.ledger.contains(cmd.userId)) {
        throw NotFoundError{fmt::format(
            "{}: User '{}' has no position to liquidate",
            std::source_location::current().function_name(),
            cmd.userId)};
    }

    const auto liquidation = liquidateUser(*user, true);
    updateMarginCalls();
    verifyInvariants();

    CommandResult result{true, ManualLiquidate::kType};
    liquidation.jsonSerialize(result.data, "liquidation");
    return result;
}

//-------------------------------------------------------------------------

CommandResult Exchange::handle(const LiquidationStep& cmd)
{
    auto& state = *m_state;

    if (state.inventory.empty()) {
        return CommandResult::failure(
            LiquidationStep::kType, "No engine positions to deleverage");
    }

    const auto adlResults = runADL();
    updateMarginCalls();
    verifyInvariants();

    decimal_t shortfall{};
    for (const auto& adlResult : adlResults) {
        shortfall += adlResult.shortfall;
    }
    const bool success = shortfall == 0_dec;

    CommandResult result{success, LiquidationStep::kType};
    if (!success) {
        result.error = fmt::format("Insufficient liquidity: shortfall of {}", shortfall);
    }
    auto& allocator = result.data.GetAllocator();
    result.data.AddMember(
        "method",
        rapidjson::Value{magic_enum::enum_name(cmd.method).data(), allocator},
        allocator);
    result.data.AddMember("results", serializeResults(adlResults, allocator), allocator);
    result.data.AddMember("shortfall", json::decimalValue(shortfall), allocator);
    result.data.AddMember(
        "remainingEnginePositions",
        rapidjson::Value{static_cast<uint64_t>(state.inventory.positions().size())},
        allocator);
    return result;
}

//-------------------------------------------------------------------------

CommandResult Exchange::handle(const ManualAdjustment& cmd)
{
    auto& state = *m_state;

    const auto fundEntryCount = state.insuranceFund.entryCount();
    const decimal_t balance =
        state.insuranceFund.manualAdjustment(cmd.amount, cmd.description, state.timestamp);
    emitFundEntries(fundEntryCount);
    verifyInvariants();

    CommandResult result{true, ManualAdjustment::kType};
    auto& allocator = result.data.GetAllocator();
    const auto& entry = state.insuranceFund.history().back();
    result.data.AddMember("amount", json::decimalValue(entry.amount), allocator);
    result.data.AddMember(
        "description", rapidjson::Value{entry.description.c_str(), allocator}, allocator);
    result.data.AddMember("balance", json::decimalValue(balance), allocator);
    result.data.AddMember(
        "isAtRisk", rapidjson::Value{state.insuranceFund.isAtRisk()}, allocator);
    return result;
}

//-------------------------------------------------------------------------

CommandResult Exchange::handle(const SetLiquidationEnabled& cmd)
{
    m_state->liquidationEnabled = cmd.enabled;
    CommandResult result{true, SetLiquidationEnabled::kType};
    result.data.AddMember("enabled", rapidjson::Value{cmd.enabled}, result.data.GetAllocator());
    return result;
}

//-------------------------------------------------------------------------

CommandResult Exchange::handle(const SetAdlEnabled& cmd)
{
    m_state->adlEnabled = cmd.enabled;
    CommandResult result{true, SetAdlEnabled::kType};
    result.data.AddMember("enabled", rapidjson::Value{cmd.enabled}, result.data.GetAllocator());
    return result;
}

//-------------------------------------------------------------------------

CommandResult Exchange::handle(const ResetState&)
{
    m_state = std::make_unique<ExchangeState>(m_config);
    m_state->setDebug(debug());
    m_zeroSum = checkZeroSum(*m_state);
    logDebug("STATE RESET");
    return CommandResult{true, ResetState::kType};
}

//-------------------------------------------------------------------------

CommandResult Exchange::handle(const GetState&)
{
    CommandResult result{true, GetState::kType};
    jsonSerialize(result.state);
    return result;
}

//-------------------------------------------------------------------------

CommandResult Exchange::handle(const GetInsuranceFund&)
{
    const auto& state = *m_state;
    CommandResult result{true, GetInsuranceFund::kType};
    state.insuranceFund.jsonSerialize(result.data, "insuranceFund");
    state.inventory.checkInsuranceFundSufficiency(state.markPrice, state.insuranceFund.balance())
        .jsonSerialize(result.data, "sufficiency");
    state.inventory.summary(state.markPrice).jsonSerialize(result.data, "inventory");
    return result;
}

//-------------------------------------------------------------------------

void Exchange::applyTrade(const matching::Trade& trade)
{
    auto& state = *m_state;
    const auto fundEntryCount = state.insuranceFund.entryCount();

    auto absorbUncoveredLoss = [&](const UserId& userId, const position::FillEffect& effect) {
        if (effect.uncoveredLoss == 0_dec) return;
        state.insuranceFund.absorbLoss(
            effect.uncoveredLoss,
            fmt::format(
                "Uncovered loss of '{}' closing {}@{} (trade #{})",
                userId, effect.closedSize, trade.price, trade.id),
            trade.timestamp);
    };

    absorbUncoveredLoss(
        trade.buyUserId,
        state.ledger.applyFill(
            state.users.at(trade.buyUserId),
            OrderSide::BUY,
            trade.size,
            trade.price,
            trade.buyLeverage,
            trade.timestamp));
    absorbUncoveredLoss(
        trade.sellUserId,
        state.ledger.applyFill(
            state.users.at(trade.sellUserId),
            OrderSide::SELL,
            trade.size,
            trade.price,
            trade.sellLeverage,
            trade.timestamp));
    state.tradeHistory.push_back(trade);
    m_signals.trade(trade);
    emitFundEntries(fundEntryCount);
}

//-------------------------------------------------------------------------

std::vector<liquidation::LiquidationResult> Exchange::runLiquidations()
{
    auto& state = *m_state;
    if (!state.liquidationEnabled) return {};

    std::vector<liquidation::LiquidationResult> results;
    for (const auto& candidate : state.liquidationEngine.detect(state.ledger, state.markPrice)) {
        results.push_back(liquidateUser(state.users.at(candidate.userId), false));
    }
    return results;
}

//-------------------------------------------------------------------------

liquidation::LiquidationResult Exchange::liquidateUser(position::User& user, bool manual)
{
    auto& state = *m_state;

    const auto restingOrders = state.book.ordersOf(user.id());
    const auto fundEntryCount = state.insuranceFund.entryCount();

    auto result = state.liquidationEngine.liquidate(
        user,
        state.ledger,
        state.book,
        state.inventory,
        state.insuranceFund,
        state.markPrice,
        state.timestamp,
        manual);

    for (const auto& order : restingOrders) {
        m_signals.orderCancelled(*order, state.timestamp);
    }
    emitFundEntries(fundEntryCount);
    m_signals.liquidation(result);

    return result;
}

//-------------------------------------------------------------------------

std::vector<adl::ADLResult> Exchange::runADL()
{
    auto& state = *m_state;

    const auto ids = state.inventory.positions()
        | views::transform(&liquidation::EnginePosition::id)
        | ranges::to<std::vector>();

    std::vector<adl::ADLResult> results;
    for (EnginePositionId id : ids) {
        const auto fundEntryCount = state.insuranceFund.entryCount();
        results.push_back(state.adlEngine.execute(
            id,
            state.inventory,
            state.ledger,
            state.users,
            state.insuranceFund,
            state.markPrice,
            state.timestamp));
        emitFundEntries(fundEntryCount);
        m_signals.adl(results.back());
    }
    return results;
}

//-------------------------------------------------------------------------

void Exchange::updateMarginCalls()
{
    auto& state = *m_state;
    const auto raised = state.marginMonitor.update(
        state.ledger, state.users, state.markPrice, state.timestamp);
    for (const auto& call : raised) {
        m_signals.marginCall(call);
    }
}

//-------------------------------------------------------------------------

void Exchange::emitFundEntries(size_t fromCount)
{
    const auto& fund = m_state->insuranceFund;
    const auto& history = fund.history();
    const size_t added = std::min(fund.entryCount() - fromCount, history.size());
    for (auto it = history.end() - static_cast<std::ptrdiff_t>(added); it != history.end(); ++it) {
        m_signals.fundAdjustment(*it);
    }
}

//-------------------------------------------------------------------------

void Exchange::verifyInvariants()
{
    m_zeroSum = checkZeroSum(*m_state);
    if (m_zeroSum.ok()) return;

    m_signals.invariantViolation(m_zeroSum);
    const auto message = fmt::format(
        "{}: Zero-sum check failed at {}: size imbalance {}, net PnL {}, equity drift {}",
        std::source_location::current().function_name(),
        m_zeroSum.timestamp,
        m_zeroSum.sizeImbalance,
        m_zeroSum.netPnL,
        m_zeroSum.equityDrift);
    if (m_config.strictInvariants) {
        throw InvariantViolation{message};
    }
    spdlog::error(message);
}

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
