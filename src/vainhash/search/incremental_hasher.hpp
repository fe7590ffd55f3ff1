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

#ifndef INCLUDED_SRC_VAINHASH_SEARCH_INCREMENTAL_HASHER_HPP
#define INCLUDED_SRC_VAINHASH_SEARCH_INCREMENTAL_HASHER_HPP

#include <optional>
#include <string_view>

#include "gsl/gsl"
#include "src/vainhash/commit/commit_template.hpp"
#include "src/vainhash/commit/timestamp.hpp"
#include "src/vainhash/crypto/hasher.hpp"

/// \brief Hashes candidate commits, reusing the hash state over the git
/// object header and the template's prefix for every candidate.
/// Trying candidates does not modify the hasher, so a single instance can be
/// shared between threads. The template must outlive the hasher.
class IncrementalHasher final {
  public:
    explicit IncrementalHasher(
        gsl::not_null<CommitTemplate const*> const& commit);

    /// \brief Git object id of the commit with shifted timestamps, or
    /// std::nullopt if the shift would change a timestamp's width or make it
    /// negative.
    [[nodiscard]] auto Try(OffsetPair const& offsets) const noexcept
        -> std::optional<Hasher::HashDigest>;

  private:
    gsl::not_null<CommitTemplate const*> commit_;
    Hasher prefix_state_;
    std::string_view middle_;
    std::string_view suffix_;
};

#endif  // INCLUDED_SRC_VAINHASH_SEARCH_INCREMENTAL_HASHER_HPP
