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

#ifndef INCLUDED_SRC_UTILS_CPP_HEX_STRING_HPP
#define INCLUDED_SRC_UTILS_CPP_HEX_STRING_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/// \brief Lower-case hexadecimal rendering of raw bytes.
template <class TBytes>
[[nodiscard]] static inline auto ToHexString(TBytes const& bytes)
    -> std::string {
    static constexpr std::string_view kDigits = "0123456789abcdef";
    static constexpr std::uint8_t kNibbleMask = 0x0f;
    static constexpr int kNibbleBits = 4;
    std::string hex{};
    hex.reserve(bytes.size() * 2);
    for (auto const& b : bytes) {
        auto const byte = static_cast<std::uint8_t>(b);
        hex.push_back(kDigits[byte >> kNibbleBits]);
        hex.push_back(kDigits[byte & kNibbleMask]);
    }
    return hex;
}

/// \brief Value of a single hex character. Upper-case letters are accepted.
[[nodiscard]] static inline auto HexCharToNibble(char c) noexcept
    -> std::optional<std::uint8_t> {
    static constexpr std::uint8_t kLetterOffset = 10;
    if (c >= '0' and c <= '9') {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' and c <= 'f') {
        return static_cast<std::uint8_t>(c - 'a' + kLetterOffset);
    }
    if (c >= 'A' and c <= 'F') {
        return static_cast<std::uint8_t>(c - 'A' + kLetterOffset);
    }
    return std::nullopt;
}

/// \brief Raw bytes of a hex string of even length, std::nullopt if the
/// string is malformed.
[[nodiscard]] static inline auto FromHexString(std::string_view hexstring)
    -> std::optional<std::string> {
    static constexpr int kNibbleBits = 4;
    if (hexstring.size() % 2 != 0) {
        return std::nullopt;
    }
    std::string bytes{};
    bytes.reserve(hexstring.size() / 2);
    for (std::size_t i = 0; i < hexstring.size(); i += 2) {
        auto high = HexCharToNibble(hexstring[i]);
        auto low = HexCharToNibble(hexstring[i + 1]);
        if (not high or not low) {
            return std::nullopt;
        }
        bytes.push_back(
            static_cast<char>((*high << kNibbleBits) | *low));  // NOLINT
    }
    return bytes;
}

#endif  // INCLUDED_SRC_UTILS_CPP_HEX_STRING_HPP
