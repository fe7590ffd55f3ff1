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

#ifndef INCLUDED_SRC_VAINHASH_SEARCH_OFFSET_ENUMERATOR_HPP
#define INCLUDED_SRC_VAINHASH_SEARCH_OFFSET_ENUMERATOR_HPP

#include <cstdint>
#include <optional>

#include "src/vainhash/commit/timestamp.hpp"

/// \brief Offset pair together with its position in the spiral.
struct IndexedOffset {
    std::uint64_t index{};
    OffsetPair offsets{};
};

/// \brief Square spiral walk over integer pairs, starting next to the origin
/// and moving outward ring by ring: (1,0), (1,1), (0,1), (-1,1), (-1,0), ...
/// Ring `s` holds all pairs with max(|x|, |y|) == s. The walk ends after
/// ring `bound`, i.e., at index (2*bound+1)^2 - 1.
class OffsetEnumerator final {
  public:
    static constexpr std::int64_t kDefaultBound = 3600;
    static constexpr std::int64_t kMaxBound = 1'000'000;

    /// \brief Lazy iteration over the indices first, first+stride, ...
    class Cursor final {
      public:
        Cursor(std::uint64_t first,
               std::uint64_t stride,
               std::uint64_t max_index) noexcept
            : next_{first}, stride_{stride}, max_index_{max_index} {}

        [[nodiscard]] auto Next() noexcept -> std::optional<IndexedOffset> {
            if (next_ > max_index_) {
                return std::nullopt;
            }
            auto const index = next_;
            next_ += stride_;
            return IndexedOffset{.index = index, .offsets = At(index)};
        }

      private:
        std::uint64_t next_;
        std::uint64_t stride_;
        std::uint64_t max_index_;
    };

    explicit OffsetEnumerator(std::int64_t bound = kDefaultBound) noexcept;

    [[nodiscard]] auto Bound() const noexcept -> std::int64_t {
        return bound_;
    }

    /// \brief Index of the last pair of the walk.
    [[nodiscard]] auto MaxIndex() const noexcept -> std::uint64_t {
        return max_index_;
    }

    /// \brief Pair at spiral index `n`, which must be positive. Pure function
    /// of `n`.
    [[nodiscard]] static auto At(std::uint64_t n) noexcept -> OffsetPair;

    /// \brief Indices `first`, `first + stride`, ... up to MaxIndex().
    /// Both `first` and `stride` must be positive.
    [[nodiscard]] auto Stride(std::uint64_t first,
                              std::uint64_t stride) const noexcept -> Cursor;

  private:
    std::int64_t bound_;
    std::uint64_t max_index_;
};

#endif  // INCLUDED_SRC_VAINHASH_SEARCH_OFFSET_ENUMERATOR_HPP
