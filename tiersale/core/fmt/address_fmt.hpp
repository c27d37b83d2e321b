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

#include <evmc/hex.hpp>
#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <string>
#include <type_traits>

template <>
struct quill::copy_loggable<tiersale::Address> : std::true_type
{
};

template <>
struct fmt::formatter<tiersale::Address> : fmt::formatter<std::string>
{
    template <typename FormatContext>
    auto format(tiersale::Address const &value, FormatContext &ctx) const
    {
        return fmt::formatter<std::string>::format(
            "0x" + evmc::hex({value.bytes, sizeof(value.bytes)}), ctx);
    }
};
