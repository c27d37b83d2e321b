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

#include <tiersale/sale/tier.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <string_view>
#include <type_traits>

template <>
struct quill::copy_loggable<tiersale::Tier> : std::true_type
{
};

template <>
struct fmt::formatter<tiersale::Tier> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(tiersale::Tier const &value, FormatContext &ctx) const
    {
        using tiersale::Tier;

        std::string_view name = "closed";
        switch (value) {
        case Tier::One:
            name = "tier 1";
            break;
        case Tier::Two:
            name = "tier 2";
            break;
        case Tier::Three:
            name = "tier 3";
            break;
        case Tier::Closed:
            break;
        }
        return fmt::formatter<std::string_view>::format(name, ctx);
    }
};
