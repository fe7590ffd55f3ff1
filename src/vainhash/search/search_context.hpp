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

#ifndef INCLUDED_SRC_VAINHASH_SEARCH_SEARCH_CONTEXT_HPP
#define INCLUDED_SRC_VAINHASH_SEARCH_SEARCH_CONTEXT_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>

#include "src/vainhash/commit/timestamp.hpp"
#include "src/vainhash/crypto/hasher.hpp"

/// \brief Winning candidate of a search.
struct SearchResult {
    std::uint64_t index{};
    OffsetPair offsets{};
    Hasher::HashDigest digest;
};

/// \brief State shared by the workers of one search run and the thread
/// waiting for its outcome. The first successful Publish() wins; later
/// results are dropped.
class SearchContext final {
  public:
    explicit SearchContext(std::size_t workers) noexcept
        : live_workers_{workers} {}

    SearchContext(SearchContext const&) = delete;
    SearchContext(SearchContext&&) = delete;
    auto operator=(SearchContext const&) -> SearchContext& = delete;
    auto operator=(SearchContext&&) -> SearchContext& = delete;
    ~SearchContext() noexcept = default;

    /// \brief Cancellation token checked by workers before every candidate.
    [[nodiscard]] auto IsFound() const noexcept -> bool {
        return found_.load(std::memory_order_acquire);
    }

    /// \brief Offer a result. Returns true if this call won the race.
    [[nodiscard]] auto Publish(SearchResult const& result) noexcept -> bool;

    /// \brief Account candidates processed since the last report.
    void AddCounts(std::uint64_t tried, std::uint64_t skipped) noexcept {
        tried_.fetch_add(tried, std::memory_order_relaxed);
        skipped_.fetch_add(skipped, std::memory_order_relaxed);
    }

    /// \brief Mark one worker as finished, with or without success.
    void WorkerDone() noexcept;

    /// \brief Block until a result is published or all workers are done.
    void Wait() noexcept;

    [[nodiscard]] auto Result() const noexcept -> std::optional<SearchResult>;

    [[nodiscard]] auto Tried() const noexcept -> std::uint64_t {
        return tried_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] auto Skipped() const noexcept -> std::uint64_t {
        return skipped_.load(std::memory_order_relaxed);
    }

  private:
    std::atomic<bool> found_{false};
    std::atomic<std::uint64_t> tried_{0};
    std::atomic<std::uint64_t> skipped_{0};
    mutable std::mutex mutex_{};
    std::condition_variable cv_{};
    std::optional<SearchResult> result_{};  // guarded by mutex_
    std::size_t live_workers_;              // guarded by mutex_
};

#endif  // INCLUDED_SRC_VAINHASH_SEARCH_SEARCH_CONTEXT_HPP
