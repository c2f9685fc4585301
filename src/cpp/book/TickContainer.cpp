/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/book/OrderContainer.hpp"
#include "derivsim/book/TickContainer.hpp"

//-------------------------------------------------------------------------

namespace derivsim::book
{

//-------------------------------------------------------------------------

TickContainer::TickContainer(OrderContainer* orderContainer, decimal_t price) noexcept
    : list{}, m_orderContainer{orderContainer}, m_price{price}
{}

//-------------------------------------------------------------------------

void TickContainer::updateVolume(decimal_t deltaVolume) noexcept
{
    m_volume += deltaVolume;
    m_orderContainer->updateVolume(deltaVolume);
}

//-------------------------------------------------------------------------

void TickContainer::push_back(const TickContainer::value_type& order)
{
    ContainerType::push_back(order);
    updateVolume(order->size());
}

//-------------------------------------------------------------------------

void TickContainer::pop_front()
{
    ContainerType::pop_front();
}

//-------------------------------------------------------------------------

void TickContainer::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("price", json::decimalValue(m_price), allocator);
        json.AddMember("size", json::decimalValue(m_volume), allocator);
        json.AddMember("orders", rapidjson::Value{static_cast<uint64_t>(size())}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace derivsim::book

//-------------------------------------------------------------------------
