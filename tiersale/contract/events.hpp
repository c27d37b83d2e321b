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
#include <tiersale/core/byte_string.hpp>
#include <tiersale/core/bytes.hpp>
#include <tiersale/core/config.hpp>
#include <tiersale/state/log.hpp>

#include <utility>

TIERSALE_NAMESPACE_BEGIN

// Builds a solidity compatible log. Indexed parameters go in topics, the
// rest is abi encoded into data.
class EventBuilder
{
    Log log_;

public:
    EventBuilder(Address const &emitter, bytes32_t const &signature)
    {
        log_.address = emitter;
        log_.topics.push_back(signature);
    }

    EventBuilder &add_topic(bytes32_t const &topic)
    {
        log_.topics.push_back(topic);
        return *this;
    }

    EventBuilder &add_data(bytes32_t const &word)
    {
        log_.data += byte_string_view{word.bytes, sizeof(word.bytes)};
        return *this;
    }

    Log build()
    {
        return std::move(log_);
    }
};

TIERSALE_NAMESPACE_END
