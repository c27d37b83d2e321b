// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <tiersale/core/address.hpp>
#include <tiersale/core/config.hpp>
#include <tiersale/core/int.hpp>
#include <tiersale/core/result.hpp>

TIERSALE_NAMESPACE_BEGIN

class State;

// Receives the value of every accepted deposit.
class Custodian
{
public:
    virtual ~Custodian() = default;

    virtual Address const &destination() const noexcept = 0;

    virtual Result<void>
    forward(Address const &from, uint256_t const &amount) = 0;
};

// Moves the value between balances of the same State.
class StateCustodian final : public Custodian
{
    State &state_;
    Address destination_;

public:
    StateCustodian(State &, Address const &destination);

    Address const &destination() const noexcept override
    {
        return destination_;
    }

    Result<void>
    forward(Address const &from, uint256_t const &amount) override;
};

TIERSALE_NAMESPACE_END
