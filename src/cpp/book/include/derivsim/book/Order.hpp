/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/serialization/JsonSerializable.hpp"
#include "derivsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace derivsim::book
{

//-------------------------------------------------------------------------

enum class OrderType : uint32_t
{
    LIMIT,
    MARKET
};

[[nodiscard]] constexpr std::string_view OrderType2StrView(OrderType type) noexcept
{
    return magic_enum::enum_name(type);
}

//-------------------------------------------------------------------------

class Order : public JsonSerializable
{
public:
    using Ptr = std::shared_ptr<Order>;

    Order(
        OrderId id,
        Timestamp timestamp,
        UserId userId,
        OrderSide side,
        OrderType type,
        decimal_t size,
        decimal_t price,
        decimal_t leverage) noexcept;

    [[nodiscard]] OrderId id() const noexcept { return m_id; }
    [[nodiscard]] Timestamp timestamp() const noexcept { return m_timestamp; }
    [[nodiscard]] const UserId& userId() const noexcept { return m_userId; }
    [[nodiscard]] OrderSide side() const noexcept { return m_side; }
    [[nodiscard]] OrderType type() const noexcept { return m_type; }
    [[nodiscard]] decimal_t size() const noexcept { return m_size; }
    [[nodiscard]] decimal_t originalSize() const noexcept { return m_originalSize; }
    [[nodiscard]] decimal_t filledSize() const noexcept { return m_originalSize - m_size; }
    [[nodiscard]] decimal_t price() const noexcept { return m_price; }
    [[nodiscard]] decimal_t leverage() const noexcept { return m_leverage; }
    [[nodiscard]] bool isMarket() const noexcept { return m_type == OrderType::MARKET; }

    void removeSize(decimal_t decrease);
    void setTimestamp(Timestamp timestamp) noexcept { m_timestamp = timestamp; }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    OrderId m_id;
    Timestamp m_timestamp;
    UserId m_userId;
    OrderSide m_side;
    OrderType m_type;
    decimal_t m_size;
    decimal_t m_originalSize;
    decimal_t m_price;
    decimal_t m_leverage;
};

//-------------------------------------------------------------------------

}  // namespace derivsim::book

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<derivsim::book::OrderType>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(derivsim::book::OrderType type, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", derivsim::book::OrderType2StrView(type));
    }
};

//-------------------------------------------------------------------------
