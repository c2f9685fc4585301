/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/serialization/JsonSerializable.hpp"
#include "derivsim/util/common.hpp"

#include <boost/circular_buffer.hpp>

//-------------------------------------------------------------------------

namespace derivsim::liquidation
{

//-------------------------------------------------------------------------

enum class FundEntryKind : uint32_t
{
    LIQUIDATION_MARGIN,
    ADL_SETTLEMENT,
    UNCOVERED_LOSS,
    MANUAL_DEPOSIT,
    MANUAL_WITHDRAWAL
};

struct FundEntry
{
    Timestamp timestamp;
    FundEntryKind kind;
    decimal_t amount;
    decimal_t balanceAfter;
    std::string description;
};

//-------------------------------------------------------------------------

/**
 * Pooled collateral backing exchange-held positions. The balance is signed;
 * a negative balance is a system deficit. Only the most recent
 * historyCapacity entries are kept.
 */
class InsuranceFund : public JsonSerializable
{
public:
    InsuranceFund(
        decimal_t initialBalance,
        decimal_t riskThreshold,
        size_t historyCapacity = kDefaultHistoryCapacity);

    [[nodiscard]] decimal_t balance() const noexcept { return m_balance; }
    [[nodiscard]] decimal_t initialBalance() const noexcept { return m_initialBalance; }
    [[nodiscard]] decimal_t riskThreshold() const noexcept { return m_riskThreshold; }
    [[nodiscard]] decimal_t manualAdjustmentsTotal() const noexcept { return m_manualAdjustments; }
    // Trading losses users could not cover, paid out of the fund.
    [[nodiscard]] decimal_t absorbedLosses() const noexcept { return m_absorbedLosses; }
    // Most recent entries, oldest first.
    [[nodiscard]] const boost::circular_buffer<FundEntry>& history() const noexcept { return m_history; }
    // Number of entries ever recorded, including those dropped from history.
    [[nodiscard]] size_t entryCount() const noexcept { return m_entryCount; }
    [[nodiscard]] bool isAtRisk() const noexcept { return m_balance < m_riskThreshold; }

    // Signed change of the balance, recorded in the history.
    void apply(
        decimal_t amount, FundEntryKind kind, std::string description, Timestamp timestamp);

    decimal_t manualAdjustment(decimal_t amount, std::string description, Timestamp timestamp);

    // Pays a user's uncovered trading loss.
    void absorbLoss(decimal_t loss, std::string description, Timestamp timestamp);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    decimal_t m_initialBalance;
    decimal_t m_balance;
    decimal_t m_riskThreshold;
    decimal_t m_manualAdjustments{};
    decimal_t m_absorbedLosses{};
    boost::circular_buffer<FundEntry> m_history;
    size_t m_entryCount{};
};

//-------------------------------------------------------------------------

}  // namespace derivsim::liquidation

//-------------------------------------------------------------------------
