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

#ifndef INCLUDED_SRC_VAINHASH_COMMIT_TIMESTAMP_HPP
#define INCLUDED_SRC_VAINHASH_COMMIT_TIMESTAMP_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/// \brief Pair of shifts applied to the author and committer timestamps.
struct OffsetPair {
    std::int64_t delta_author{};
    std::int64_t delta_committer{};

    [[nodiscard]] auto operator==(OffsetPair const& other) const noexcept
        -> bool = default;
};

/// \brief Unix timestamp together with the number of decimal digits it
/// occupies in the serialized commit. Shifting never changes the width.
class Timestamp final {
  public:
    /// \brief Widest timestamp accepted, leaves room for shifting in int64.
    static constexpr std::size_t kMaxWidth = 18;

    /// \brief Parse a run of decimal digits. Empty runs, runs wider than
    /// kMaxWidth, and leading zeros are rejected.
    [[nodiscard]] static auto FromDigits(std::string_view digits) noexcept
        -> std::optional<Timestamp>;

    [[nodiscard]] auto Value() const noexcept -> std::int64_t {
        return value_;
    }
    [[nodiscard]] auto Width() const noexcept -> std::size_t { return width_; }

    /// \brief Shifted value, std::nullopt if it would be negative or have a
    /// different number of digits.
    [[nodiscard]] auto Shift(std::int64_t delta) const noexcept
        -> std::optional<std::int64_t> {
        auto const shifted = value_ + delta;
        if (shifted < min_ or shifted > max_) {
            return std::nullopt;
        }
        return shifted;
    }

    /// \brief Decimal rendering of the shifted value, std::nullopt if the
    /// shift is not admissible.
    [[nodiscard]] auto Render(std::int64_t delta = 0) const
        -> std::optional<std::string>;

  private:
    std::int64_t value_{};
    std::size_t width_{};
    std::int64_t min_{};
    std::int64_t max_{};

    Timestamp(std::int64_t value, std::size_t width) noexcept;
};

#endif  // INCLUDED_SRC_VAINHASH_COMMIT_TIMESTAMP_HPP
