/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/serialization/JsonSerializable.hpp"

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

struct CommandResult : public JsonSerializable
{
    bool success;
    std::string type;
    std::optional<std::string> error;
    // Command specific payload, an object.
    rapidjson::Document data;
    // Snapshot of the exchange after the command, null when not attached.
    rapidjson::Document state;

    CommandResult(bool success, std::string_view type);

    CommandResult(CommandResult&&) noexcept = default;
    CommandResult& operator=(CommandResult&&) noexcept = default;

    [[nodiscard]] static CommandResult failure(std::string_view type, std::string error);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
