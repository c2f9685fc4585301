/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/liquidation/InsuranceFund.hpp"

//-------------------------------------------------------------------------

namespace derivsim::liquidation
{

//-------------------------------------------------------------------------

InsuranceFund::InsuranceFund(
    decimal_t initialBalance, decimal_t riskThreshold, size_t historyCapacity)
    : m_initialBalance{initialBalance},
      m_balance{initialBalance},
      m_riskThreshold{riskThreshold},
      m_history(historyCapacity)
{}

//-------------------------------------------------------------------------

void InsuranceFund::apply(
    decimal_t amount, FundEntryKind kind, std::string description, Timestamp timestamp)
{
    m_balance += amount;
    m_history.push_back(FundEntry{
        .timestamp = timestamp,
        .kind = kind,
        .amount = amount,
        .balanceAfter = m_balance,
        .description = std::move(description)
    });
    ++m_entryCount;
}

//-------------------------------------------------------------------------

decimal_t InsuranceFund::manualAdjustment(
    decimal_t amount, std::string description, Timestamp timestamp)
{
    if (!util::isFinite(amount) || amount == 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: Adjustment amount must be finite and non-zero, was {}",
            std::source_location::current().function_name(),
            amount)};
    }
    const auto kind = amount > 0_dec ? FundEntryKind::MANUAL_DEPOSIT : FundEntryKind::MANUAL_WITHDRAWAL;
    if (description.empty()) {
        description = kind == FundEntryKind::MANUAL_DEPOSIT ? "Manual deposit" : "Manual withdrawal";
    }
    m_manualAdjustments += amount;
    apply(amount, kind, std::move(description), timestamp);
    return m_balance;
}

//-------------------------------------------------------------------------

void InsuranceFund::absorbLoss(decimal_t loss, std::string description, Timestamp timestamp)
{
    if (!(loss > 0_dec)) {
        throw std::invalid_argument{fmt::format(
            "{}: Absorbed loss must be positive, was {}",
            std::source_location::current().function_name(),
            loss)};
    }
    m_absorbedLosses += loss;
    apply(-loss, FundEntryKind::UNCOVERED_LOSS, std::move(description), timestamp);
}

//-------------------------------------------------------------------------

void InsuranceFund::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("balance", json::decimalValue(m_balance), allocator);
        json.AddMember("initialBalance", json::decimalValue(m_initialBalance), allocator);
        json.AddMember("riskThreshold", json::decimalValue(m_riskThreshold), allocator);
        json.AddMember("isAtRisk", rapidjson::Value{isAtRisk()}, allocator);
        json.AddMember("absorbedLosses", json::decimalValue(m_absorbedLosses), allocator);
        json.AddMember(
            "entryCount", rapidjson::Value{static_cast<uint64_t>(m_entryCount)}, allocator);
        rapidjson::Value historyJson{rapidjson::kArrayType};
        for (const auto& entry : m_history) {
            rapidjson::Value entryJson{rapidjson::kObjectType};
            entryJson.AddMember("timestamp", rapidjson::Value{entry.timestamp}, allocator);
            entryJson.AddMember(
                "type",
                rapidjson::Value{magic_enum::enum_name(entry.kind).data(), allocator},
                allocator);
            entryJson.AddMember("amount", json::decimalValue(entry.amount), allocator);
            entryJson.AddMember("balance", json::decimalValue(entry.balanceAfter), allocator);
            entryJson.AddMember(
                "description", rapidjson::Value{entry.description.c_str(), allocator}, allocator);
            historyJson.PushBack(entryJson, allocator);
        }
        json.AddMember("history", historyJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace derivsim::liquidation

//-------------------------------------------------------------------------
