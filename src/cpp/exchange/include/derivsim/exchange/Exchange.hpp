/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/exchange/Command.hpp"
#include "derivsim/exchange/CommandResult.hpp"
#include "derivsim/exchange/ExchangeSignals.hpp"
#include "derivsim/exchange/ExchangeState.hpp"
#include "derivsim/exchange/OrderPlacementValidator.hpp"
#include "derivsim/exchange/ZeroSum.hpp"

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

/**
 * Single-writer orchestrator of the exchange. Every command is processed to
 * completion (matching, position and balance updates, liquidation, ADL and
 * the zero-sum check) before the next one is accepted.
 */
class Exchange : public JsonSerializable, public util::DebugLogger
{
public:
    explicit Exchange(ExchangeConfig config = ExchangeConfig::defaults());

    [[nodiscard]] const ExchangeConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const ExchangeState& state() const noexcept { return *m_state; }
    [[nodiscard]] ExchangeSignals& signals() noexcept { return m_signals; }
    [[nodiscard]] const ZeroSumReport& zeroSumReport() const noexcept { return m_zeroSum; }
    [[nodiscard]] bool attachState() const noexcept { return m_attachState; }

    CommandResult process(const Command& command);
    // Parses a Json command first; parse errors become failed results.
    CommandResult process(const std::string& message);

    void setAttachState(bool flag) noexcept { m_attachState = flag; }
    void setDebug(bool flag) noexcept;

    // Full state snapshot.
    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    CommandResult handle(const PlaceOrder& cmd);
    CommandResult handle(const CancelOrder& cmd);
    CommandResult handle(const UpdateMarkPrice& cmd);
    CommandResult handle(const DetectLiquidations& cmd);
    CommandResult handle(const ManualLiquidate& cmd);
    CommandResult handle(const LiquidationStep& cmd);
    CommandResult handle(const ManualAdjustment& cmd);
    CommandResult handle(const SetLiquidationEnabled& cmd);
    CommandResult handle(const SetAdlEnabled& cmd);
    CommandResult handle(const ResetState& cmd);
    CommandResult handle(const GetState& cmd);
    CommandResult handle(const GetInsuranceFund& cmd);

    void applyTrade(const matching::Trade& trade);
    [[nodiscard]] std::vector<liquidation::LiquidationResult> runLiquidations();
    liquidation::LiquidationResult liquidateUser(position::User& user, bool manual);
    [[nodiscard]] std::vector<adl::ADLResult> runADL();
    void updateMarginCalls();
    // Signals the fund entries recorded since the fund's entry count was fromCount.
    void emitFundEntries(size_t fromCount);
    void verifyInvariants();

    ExchangeConfig m_config;
    OrderPlacementValidator m_validator;
    std::unique_ptr<ExchangeState> m_state;
    ExchangeSignals m_signals;
    ZeroSumReport m_zeroSum;
    bool m_attachState = true;
};

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
