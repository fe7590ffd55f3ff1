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

#ifndef INCLUDED_SRC_VAINHASH_SEARCH_TARGET_PATTERN_HPP
#define INCLUDED_SRC_VAINHASH_SEARCH_TARGET_PATTERN_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "src/utils/cpp/expected.hpp"
#include "src/vainhash/common/vain_error.hpp"
#include "src/vainhash/crypto/hasher.hpp"

/// \brief Compiled hex prefix a digest has to start with. Odd-length
/// patterns compare the last nibble against the high half of the byte.
class TargetPattern final {
  public:
    static constexpr std::size_t kMaxNibbles = 16;

    /// \brief Compile a pattern of 1 to kMaxNibbles hex characters. Upper-case
    /// characters are accepted and normalized to lower case.
    [[nodiscard]] static auto Create(std::string_view hex)
        -> expected<TargetPattern, VainError>;

    [[nodiscard]] auto Matches(Hasher::HashDigest::Bytes const& digest)
        const noexcept -> bool;

    [[nodiscard]] auto Matches(Hasher::HashDigest const& digest) const noexcept
        -> bool {
        return Matches(digest.Raw());
    }

    [[nodiscard]] auto NibbleCount() const noexcept -> std::size_t {
        return text_.size();
    }

    [[nodiscard]] auto HasOddTrailingNibble() const noexcept -> bool {
        return text_.size() % 2 != 0;
    }

    /// \brief Normalized lower-case pattern.
    [[nodiscard]] auto ToString() const& noexcept -> std::string const& {
        return text_;
    }

  private:
    std::array<std::uint8_t, kMaxNibbles / 2> bytes_{};
    std::string text_;

    TargetPattern(std::array<std::uint8_t, kMaxNibbles / 2> const& bytes,
                  std::string text) noexcept;
};

#endif  // INCLUDED_SRC_VAINHASH_SEARCH_TARGET_PATTERN_HPP
