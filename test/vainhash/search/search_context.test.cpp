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

#include "src/vainhash/search/search_context.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "src/vainhash/crypto/git_object_hash.hpp"

namespace {
[[nodiscard]] auto MakeResult(std::uint64_t index) -> SearchResult {
    return SearchResult{.index = index,
                        .offsets = {.delta_author = 1},
                        .digest = HashGitCommit("content")};
}
}  // namespace

TEST_CASE("First publisher wins", "[search]") {
    SearchContext context{2};
    CHECK_FALSE(context.IsFound());
    CHECK_FALSE(context.Result());

    CHECK(context.Publish(MakeResult(3)));
    CHECK(context.IsFound());
    CHECK_FALSE(context.Publish(MakeResult(4)));

    auto result = context.Result();
    REQUIRE(result);
    CHECK(result->index == 3);
}

TEST_CASE("Exactly one of many concurrent publishers wins", "[search]") {
    constexpr std::size_t kThreads = 16;
    SearchContext context{kThreads};
    std::atomic<std::size_t> winners{0};
    std::atomic<bool> go{false};
    {
        std::vector<std::thread> threads{};
        threads.reserve(kThreads);
        for (std::size_t i = 0; i < kThreads; ++i) {
            threads.emplace_back([&, i]() {
                while (not go) {
                    std::this_thread::yield();
                }
                if (context.Publish(MakeResult(i + 1))) {
                    ++winners;
                }
                context.WorkerDone();
            });
        }
        go = true;
        context.Wait();
        for (auto& t : threads) {
            t.join();
        }
    }
    CHECK(winners == 1);
    auto result = context.Result();
    REQUIRE(result);
    CHECK(result->index >= 1);
    CHECK(result->index <= kThreads);
}

TEST_CASE("Waiting ends when all workers are done", "[search]") {
    SearchContext context{3};
    {
        std::vector<std::thread> threads{};
        for (std::size_t i = 0; i < 3; ++i) {
            threads.emplace_back([&context]() {
                context.AddCounts(10, 1);
                context.WorkerDone();
            });
        }
        context.Wait();
        for (auto& t : threads) {
            t.join();
        }
    }
    CHECK_FALSE(context.IsFound());
    CHECK_FALSE(context.Result());
    CHECK(context.Tried() == 30);
    CHECK(context.Skipped() == 3);
}
