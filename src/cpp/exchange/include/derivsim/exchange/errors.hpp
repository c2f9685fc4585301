/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

// Liquidation or cancellation of a user, position or order that does not exist.
class NotFoundError : public std::runtime_error
{
public:
    explicit NotFoundError(const std::string& message) : std::runtime_error{message} {}
};

class UnknownCommandError : public std::runtime_error
{
public:
    explicit UnknownCommandError(const std::string& message) : std::runtime_error{message} {}
};

// Zero-sum or conservation check failure.
class InvariantViolation : public std::runtime_error
{
public:
    explicit InvariantViolation(const std::string& message) : std::runtime_error{message} {}
};

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
