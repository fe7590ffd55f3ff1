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

#ifndef INCLUDED_SRC_VAINHASH_SEARCH_SEARCH_COORDINATOR_HPP
#define INCLUDED_SRC_VAINHASH_SEARCH_SEARCH_COORDINATOR_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "gsl/gsl"
#include "src/vainhash/commit/commit_template.hpp"
#include "src/vainhash/search/incremental_hasher.hpp"
#include "src/vainhash/search/offset_enumerator.hpp"
#include "src/vainhash/search/search_context.hpp"
#include "src/vainhash/search/target_pattern.hpp"

struct SearchOptions {
    std::int64_t bound{OffsetEnumerator::kDefaultBound};
    std::size_t jobs{1};
    bool report_progress{false};
};

struct SearchStatistics {
    std::uint64_t tried{};    ///< candidates hashed
    std::uint64_t skipped{};  ///< candidates changing a timestamp's width
    std::size_t jobs{};
    std::chrono::duration<double> elapsed{};
};

struct SearchOutcome {
    std::optional<SearchResult> result{};  ///< std::nullopt if not found
    SearchStatistics statistics{};
};

/// \brief Runs the search for a commit id matching a pattern. Worker `i` of
/// `T` workers visits the spiral indices i, i+T, i+2T, ... (1-based) until
/// some worker finds a match or all indices up to the bound are visited.
class SearchCoordinator final {
  public:
    SearchCoordinator(gsl::not_null<CommitTemplate const*> const& commit,
                      gsl::not_null<TargetPattern const*> const& pattern,
                      SearchOptions const& options) noexcept
        : commit_{commit}, pattern_{pattern}, options_{options} {}

    /// \brief Block until the first match is found or the space within the
    /// bound is exhausted.
    [[nodiscard]] auto Run() const -> SearchOutcome;

  private:
    gsl::not_null<CommitTemplate const*> commit_;
    gsl::not_null<TargetPattern const*> pattern_;
    SearchOptions options_;

    void RunWorker(std::size_t worker,
                   std::size_t jobs,
                   OffsetEnumerator const& enumerator,
                   IncrementalHasher const& hasher,
                   gsl::not_null<SearchContext*> const& context) const noexcept;
};

#endif  // INCLUDED_SRC_VAINHASH_SEARCH_SEARCH_COORDINATOR_HPP
