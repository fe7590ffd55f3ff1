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

#include "src/vainhash/search/offset_enumerator.hpp"

#include <cmath>

#include "gsl/gsl"

namespace {
[[nodiscard]] auto IntegerSqrt(std::uint64_t n) noexcept -> std::uint64_t {
    auto root =
        static_cast<std::uint64_t>(std::sqrt(static_cast<long double>(n)));
    while (root * root > n) {
        --root;
    }
    while ((root + 1) * (root + 1) <= n) {
        ++root;
    }
    return root;
}
}  // namespace

OffsetEnumerator::OffsetEnumerator(std::int64_t bound) noexcept
    : bound_{bound} {
    Expects(bound >= 0 and bound <= kMaxBound);
    auto const side = static_cast<std::uint64_t>(2 * bound + 1);
    max_index_ = side * side - 1;
}

auto OffsetEnumerator::At(std::uint64_t n) noexcept -> OffsetPair {
    Expects(n > 0);
    auto const ring = static_cast<std::int64_t>((IntegerSqrt(n) + 1) / 2);
    auto const inner = 2 * ring - 1;
    auto const along = static_cast<std::int64_t>(n) - inner * inner;
    auto const leg = along / (2 * ring);
    auto const e = along - 2 * ring * leg - ring + 1;
    switch (leg) {
        case 0:
            return OffsetPair{.delta_author = ring, .delta_committer = e};
        case 1:
            return OffsetPair{.delta_author = -e, .delta_committer = ring};
        case 2:
            return OffsetPair{.delta_author = -ring, .delta_committer = -e};
        default:
            return OffsetPair{.delta_author = e, .delta_committer = -ring};
    }
}

auto OffsetEnumerator::Stride(std::uint64_t first,
                              std::uint64_t stride) const noexcept -> Cursor {
    Expects(first > 0 and stride > 0);
    return Cursor{first, stride, max_index_};
}
