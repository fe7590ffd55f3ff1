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

#include "src/vainhash/search/search_coordinator.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <thread>

#include "src/vainhash/logging/log_level.hpp"
#include "src/vainhash/logging/logger.hpp"
#include "src/vainhash/multithreading/worker_group.hpp"
#include "src/vainhash/progress_reporting/progress_reporter.hpp"

namespace {
// Number of candidates a worker processes before publishing its counts
constexpr std::uint64_t kCountBatch = 1U << 14U;
}  // namespace

auto SearchCoordinator::Run() const -> SearchOutcome {
    auto const jobs = std::max(std::size_t{1}, options_.jobs);
    OffsetEnumerator const enumerator{options_.bound};
    IncrementalHasher const hasher{commit_};
    SearchContext context{jobs};

    Logger::Log(LogLevel::Info,
                "Searching {} candidates for pattern {} with {} jobs",
                enumerator.MaxIndex(),
                pattern_->ToString(),
                jobs);

    auto const start = std::chrono::steady_clock::now();
    std::atomic<bool> done{false};
    std::condition_variable cv{};
    std::optional<std::thread> reporter{};
    if (options_.report_progress) {
        reporter.emplace(
            ProgressReporter::SearchReporter(&context, enumerator.MaxIndex()),
            &done,
            &cv);
    }

    {
        WorkerGroup workers{jobs, [&](std::size_t worker) {
                                RunWorker(worker,
                                          jobs,
                                          enumerator,
                                          hasher,
                                          &context);
                            }};
        context.Wait();
    }

    done = true;
    cv.notify_all();
    if (reporter) {
        reporter->join();
    }

    auto outcome = SearchOutcome{
        .result = context.Result(),
        .statistics = SearchStatistics{
            .tried = context.Tried(),
            .skipped = context.Skipped(),
            .jobs = jobs,
            .elapsed = std::chrono::steady_clock::now() - start}};
    Logger::Log(LogLevel::Debug,
                "Search finished after {:.3f}s: {} hashed, {} skipped",
                outcome.statistics.elapsed.count(),
                outcome.statistics.tried,
                outcome.statistics.skipped);
    return outcome;
}

void SearchCoordinator::RunWorker(
    std::size_t worker,
    std::size_t jobs,
    OffsetEnumerator const& enumerator,
    IncrementalHasher const& hasher,
    gsl::not_null<SearchContext*> const& context) const noexcept {
    auto cursor = enumerator.Stride(worker + 1, jobs);
    std::uint64_t tried{};
    std::uint64_t skipped{};
    while (not context->IsFound()) {
        auto next = cursor.Next();
        if (not next) {
            break;
        }
        auto digest = hasher.Try(next->offsets);
        if (not digest) {
            ++skipped;
        }
        else {
            ++tried;
            if (pattern_->Matches(*digest)) {
                if (context->Publish(SearchResult{.index = next->index,
                                                  .offsets = next->offsets,
                                                  .digest = *digest})) {
                    Logger::Log(LogLevel::Debug,
                                "Worker {} found index {}",
                                worker,
                                next->index);
                }
                break;
            }
        }
        if (tried + skipped == kCountBatch) {
            context->AddCounts(tried, skipped);
            tried = 0;
            skipped = 0;
        }
    }
    context->AddCounts(tried, skipped);
    Logger::Log(LogLevel::Debug, "Worker {} stopped", worker);
    context->WorkerDone();
}
