/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/exchange/EventLogger.hpp"

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

EventLogger::EventLogger(const fs::path& filepath, ExchangeSignals& signals)
    : m_filepath{filepath}
{
    m_logger = std::make_unique<spdlog::logger>(
        "EventLogger", std::make_unique<spdlog::sinks::basic_file_sink_st>(m_filepath, true));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");

    auto serialized = [](const auto& item) {
        rapidjson::Document json;
        item.jsonSerialize(json);
        return json;
    };

    m_feeds.emplace_back(signals.orderPlaced.connect([=, this](const book::Order& order) {
        log("orderPlaced", serialized(order));
    }));
    m_feeds.emplace_back(signals.orderCancelled.connect(
        [=, this](const book::Order& order, Timestamp timestamp) {
            rapidjson::Document json = serialized(order);
            json.AddMember("cancelledAt", rapidjson::Value{timestamp}, json.GetAllocator());
            log("orderCancelled", std::move(json));
        }));
    m_feeds.emplace_back(signals.trade.connect([=, this](const matching::Trade& trade) {
        log("trade", serialized(trade));
    }));
    m_feeds.emplace_back(signals.markPrice.connect([this](decimal_t price, Timestamp timestamp) {
        rapidjson::Document json{rapidjson::kObjectType};
        auto& allocator = json.GetAllocator();
        json.AddMember("markPrice", json::decimalValue(price), allocator);
        json.AddMember("timestamp", rapidjson::Value{timestamp}, allocator);
        log("markPrice", std::move(json));
    }));
    m_feeds.emplace_back(signals.marginCall.connect([this](const margin::MarginCall& call) {
        rapidjson::Document json{rapidjson::kObjectType};
        auto& allocator = json.GetAllocator();
        json.AddMember("userId", rapidjson::Value{call.userId.c_str(), allocator}, allocator);
        json.AddMember(
            "level",
            rapidjson::Value{margin::MarginCallLevel2StrView(call.level).data(), allocator},
            allocator);
        json.AddMember("marginRatio", json::decimalValue(call.marginRatio), allocator);
        json.AddMember("timestamp", rapidjson::Value{call.timestamp}, allocator);
        log("marginCall", std::move(json));
    }));
    m_feeds.emplace_back(signals.liquidation.connect(
        [=, this](const liquidation::LiquidationResult& result) {
            log("liquidation", serialized(result));
        }));
    m_feeds.emplace_back(signals.adl.connect([=, this](const adl::ADLResult& result) {
        log("adl", serialized(result));
    }));
    m_feeds.emplace_back(signals.fundAdjustment.connect(
        [this](const liquidation::FundEntry& entry) {
            rapidjson::Document json{rapidjson::kObjectType};
            auto& allocator = json.GetAllocator();
            json.AddMember(
                "type", rapidjson::Value{magic_enum::enum_name(entry.kind).data(), allocator}, allocator);
            json.AddMember("amount", json::decimalValue(entry.amount), allocator);
            json.AddMember("balance", json::decimalValue(entry.balanceAfter), allocator);
            json.AddMember(
                "description", rapidjson::Value{entry.description.c_str(), allocator}, allocator);
            json.AddMember("timestamp", rapidjson::Value{entry.timestamp}, allocator);
            log("fundAdjustment", std::move(json));
        }));
    m_feeds.emplace_back(signals.invariantViolation.connect(
        [=, this](const ZeroSumReport& report) {
            log("invariantViolation", serialized(report));
        }));
}

//-------------------------------------------------------------------------

void EventLogger::log(std::string_view event, rapidjson::Document json)
{
    if (!json.IsObject()) {
        json.SetObject();
    }
    json.AddMember(
        "event",
        rapidjson::Value{event.data(), static_cast<rapidjson::SizeType>(event.size()), json.GetAllocator()},
        json.GetAllocator());
    m_logger->trace(json::json2str(json));
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
