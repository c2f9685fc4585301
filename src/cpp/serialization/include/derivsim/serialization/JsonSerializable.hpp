/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/serialization/json_util.hpp"

#include <memory>

//-------------------------------------------------------------------------

namespace derivsim
{

class JsonSerializable
{
public:
    virtual ~JsonSerializable() noexcept = default;

    virtual void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const = 0;

protected:
    JsonSerializable() noexcept = default;
};

}  // namespace derivsim

//-------------------------------------------------------------------------

namespace derivsim::json
{

template<typename T>
concept IsJsonSerializableValue =
    requires (T t, rapidjson::Document& json, const std::string& key) {
        { t.jsonSerialize(json, key) };
    };

template<typename T>
concept IsJsonSerializablePointer =
    requires (T t, rapidjson::Document& json, const std::string& key) {
        { *t };
        { t->jsonSerialize(json, key) };
    };

template<typename T>
concept IsJsonSerializable = IsJsonSerializableValue<T> || IsJsonSerializablePointer<T>;

[[nodiscard]] std::string jsonSerializable2str(
    const IsJsonSerializable auto& serializable, const FormatOptions& formatOptions = {})
{
    rapidjson::Document json;
    if constexpr (IsJsonSerializablePointer<std::remove_cvref_t<decltype(serializable)>>) {
        serializable->jsonSerialize(json);
    } else {
        serializable.jsonSerialize(json);
    }
    return json2str(json, formatOptions);
}

}  // namespace derivsim::json

//-------------------------------------------------------------------------
