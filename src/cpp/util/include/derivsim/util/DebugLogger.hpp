/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>

#include <cstdio>
#include <utility>

//-------------------------------------------------------------------------

namespace derivsim::util
{

class DebugLogger
{
public:
    template<typename... Args>
    void logDebug(fmt::format_string<Args...> fmt, Args&&... args) const noexcept
    {
        if (m_debug) {
            fmt::println(stderr, fmt, std::forward<Args>(args)...);
        }
    }

    void setDebug(bool flag) noexcept { m_debug = flag; }
    [[nodiscard]] bool debug() const noexcept { return m_debug; }

protected:
    DebugLogger() noexcept = default;

private:
    bool m_debug = false;
};

}  // namespace derivsim::util

//-------------------------------------------------------------------------
