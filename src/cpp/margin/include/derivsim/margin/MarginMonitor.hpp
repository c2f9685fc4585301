/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/position/PositionLedger.hpp"
#include "derivsim/serialization/JsonSerializable.hpp"

//-------------------------------------------------------------------------

namespace derivsim::margin
{

//-------------------------------------------------------------------------

enum class MarginCallLevel : uint32_t
{
    WARNING,
    URGENT,
    CRITICAL
};

[[nodiscard]] constexpr std::string_view MarginCallLevel2StrView(MarginCallLevel level) noexcept
{
    return magic_enum::enum_name(level);
}

// Margin ratios in percent at or below which a call of each level is raised.
struct MarginCallThresholds
{
    decimal_t warning = 150_dec;
    decimal_t urgent = 120_dec;
    decimal_t critical = 105_dec;
};

struct MarginCall
{
    UserId userId;
    MarginCallLevel level;
    decimal_t marginRatio;
    decimal_t markPrice;
    Timestamp timestamp;
};

//-------------------------------------------------------------------------

class MarginMonitor : public JsonSerializable, public util::DebugLogger
{
public:
    explicit MarginMonitor(const MarginCallThresholds& thresholds = {});

    [[nodiscard]] const MarginCallThresholds& thresholds() const noexcept { return m_thresholds; }
    [[nodiscard]] const std::map<UserId, MarginCall>& activeCalls() const noexcept { return m_activeCalls; }

    [[nodiscard]] std::optional<MarginCallLevel> classify(decimal_t marginRatio) const noexcept;

    /**
     * Re-evaluates the margin ratio of every user holding a position. Returns
     * the calls that were raised or escalated; calls of users above every
     * threshold (or without a position) are cleared.
     */
    std::vector<MarginCall> update(
        const position::PositionLedger& ledger,
        const position::UserMap& users,
        decimal_t markPrice,
        Timestamp timestamp);

    void clear() noexcept { m_activeCalls.clear(); }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    MarginCallThresholds m_thresholds;
    std::map<UserId, MarginCall> m_activeCalls;
};

//-------------------------------------------------------------------------

}  // namespace derivsim::margin

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<derivsim::margin::MarginCallLevel>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(derivsim::margin::MarginCallLevel level, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", derivsim::margin::MarginCallLevel2StrView(level));
    }
};

//-------------------------------------------------------------------------
