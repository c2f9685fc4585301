/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/exchange/ExchangeSignals.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <memory>

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

/**
 * Writes every exchange event as one JSON line to a file:
 *   {"event": "<name>", ...event fields}
 */
class EventLogger
{
public:
    EventLogger(const fs::path& filepath, ExchangeSignals& signals);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

private:
    void log(std::string_view event, rapidjson::Document json);

    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    std::vector<bs2::scoped_connection> m_feeds;
};

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
