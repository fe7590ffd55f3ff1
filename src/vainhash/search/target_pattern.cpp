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

#include "src/vainhash/search/target_pattern.hpp"

#include <algorithm>
#include <utility>

#include "fmt/core.h"
#include "src/utils/cpp/hex_string.hpp"

TargetPattern::TargetPattern(
    std::array<std::uint8_t, kMaxNibbles / 2> const& bytes,
    std::string text) noexcept
    : bytes_{bytes}, text_{std::move(text)} {}

auto TargetPattern::Create(std::string_view hex)
    -> expected<TargetPattern, VainError> {
    if (hex.empty()) {
        return MakeVainError(VainError::Kind::InvalidPattern,
                             "pattern is empty");
    }
    if (hex.size() > kMaxNibbles) {
        return MakeVainError(
            VainError::Kind::InvalidPattern,
            fmt::format("pattern {} is longer than {} characters",
                        hex,
                        kMaxNibbles));
    }

    std::array<std::uint8_t, kMaxNibbles / 2> bytes{};
    std::string text{};
    text.reserve(hex.size());
    for (std::size_t i = 0; i < hex.size(); ++i) {
        auto nibble = HexCharToNibble(hex[i]);
        if (not nibble) {
            return MakeVainError(
                VainError::Kind::InvalidPattern,
                fmt::format("pattern {} contains the non-hex character '{}'",
                            hex,
                            hex[i]));
        }
        // even positions fill the high half of a byte
        auto const shift = i % 2 == 0 ? 4 : 0;
        bytes.at(i / 2) |= static_cast<std::uint8_t>(*nibble << shift);
        text.push_back("0123456789abcdef"[*nibble]);
    }
    return TargetPattern{bytes, std::move(text)};
}

auto TargetPattern::Matches(Hasher::HashDigest::Bytes const& digest)
    const noexcept -> bool {
    auto const full_bytes = text_.size() / 2;
    if (not std::equal(bytes_.begin(),
                       bytes_.begin() + static_cast<std::ptrdiff_t>(full_bytes),
                       digest.begin())) {
        return false;
    }
    if (HasOddTrailingNibble()) {
        return (digest[full_bytes] >> 4) == (bytes_[full_bytes] >> 4);
    }
    return true;
}
