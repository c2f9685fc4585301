/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/exchange/EventLogger.hpp"
#include "derivsim/exchange/Exchange.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>

using namespace derivsim;

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"Perpetual derivatives exchange simulator"};

    fs::path config;
    app.add_option("-f,--config-file", config, "Exchange config file")
        ->check(CLI::ExistingFile);

    fs::path eventLog;
    app.add_option("-l,--event-log", eventLog, "File receiving the exchange event stream");

    bool debug = false;
    app.add_flag("--debug", debug, "Log every processing step");

    bool pretty = false;
    app.add_flag("--pretty", pretty, "Indent the printed results");

    bool withState = true;
    app.add_flag("!--no-state", withState, "Do not attach the state snapshot to results");

    CLI11_PARSE(app, argc, argv);

    // Results go to stdout, diagnostics to stderr.
    spdlog::set_default_logger(spdlog::stderr_color_mt("derivsim"));

    exchange::ExchangeConfig exchangeConfig = exchange::ExchangeConfig::defaults();
    if (!config.empty()) {
        try {
            exchangeConfig = exchange::loadExchangeConfig(config);
        }
        catch (const std::exception& e) {
            spdlog::critical("Invalid config '{}': {}", config.string(), e.what());
            return 1;
        }
    }

    exchange::Exchange exchange{std::move(exchangeConfig)};
    exchange.setDebug(debug);
    exchange.setAttachState(withState);

    std::unique_ptr<exchange::EventLogger> eventLogger;
    if (!eventLog.empty()) {
        eventLogger = std::make_unique<exchange::EventLogger>(eventLog, exchange.signals());
    }

    json::FormatOptions formatOptions;
    if (pretty) {
        formatOptions.indent = json::IndentOptions{};
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        try {
            const auto result = exchange.process(line);
            rapidjson::Document json;
            result.jsonSerialize(json);
            fmt::println("{}", json::json2str(json, formatOptions));
        }
        catch (const std::exception& e) {
            spdlog::error("Command processing aborted: {}", e.what());
            rapidjson::Document json;
            exchange::CommandResult::failure("error", e.what()).jsonSerialize(json);
            fmt::println("{}", json::json2str(json, formatOptions));
        }
        std::fflush(stdout);
    }

    return 0;
}

//-------------------------------------------------------------------------
