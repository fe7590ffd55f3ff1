// Copyright 2025 Huawei Cloud Computing Technology Co., Ltd.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "src/vainhash/commit/timestamp.hpp"

#include <algorithm>

#include "fmt/format.h"

namespace {
[[nodiscard]] constexpr auto PowerOfTen(std::size_t exponent) noexcept
    -> std::int64_t {
    std::int64_t result = 1;
    for (std::size_t i = 0; i < exponent; ++i) {
        result *= 10;  // NOLINT(readability-magic-numbers)
    }
    return result;
}

[[nodiscard]] auto IsDigit(char c) noexcept -> bool {
    return c >= '0' and c <= '9';
}
}  // namespace

Timestamp::Timestamp(std::int64_t value, std::size_t width) noexcept
    : value_{value},
      width_{width},
      min_{width == 1 ? 0 : PowerOfTen(width - 1)},
      max_{PowerOfTen(width) - 1} {}

auto Timestamp::FromDigits(std::string_view digits) noexcept
    -> std::optional<Timestamp> {
    if (digits.empty() or digits.size() > kMaxWidth) {
        return std::nullopt;
    }
    if (not std::all_of(digits.begin(), digits.end(), IsDigit)) {
        return std::nullopt;
    }
    if (digits.size() > 1 and digits.front() == '0') {
        return std::nullopt;
    }
    std::int64_t value = 0;
    for (auto c : digits) {
        value = value * 10 + (c - '0');  // NOLINT(readability-magic-numbers)
    }
    return Timestamp{value, digits.size()};
}

auto Timestamp::Render(std::int64_t delta) const
    -> std::optional<std::string> {
    if (auto shifted = Shift(delta)) {
        return fmt::format_int{*shifted}.str();
    }
    return std::nullopt;
}
