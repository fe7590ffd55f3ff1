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

#include "src/vainhash/multithreading/worker_group.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <set>
#include <thread>

#include "catch2/catch_test_macros.hpp"

TEST_CASE("Basic", "[worker_group]") {
    SECTION("Destructor waits for all workers") {
        std::atomic<std::size_t> finished{0};
        {
            WorkerGroup group{4, [&finished](std::size_t /*unused*/) {
                                  std::this_thread::sleep_for(
                                      std::chrono::milliseconds(10));
                                  ++finished;
                              }};
            CHECK(group.NumberOfThreads() == 4);
        }
        CHECK(finished == 4);
    }

    SECTION("Each worker gets its own index") {
        std::mutex m{};
        std::set<std::size_t> indices{};
        {
            WorkerGroup group{5, [&](std::size_t index) {
                                  std::unique_lock lock{m};
                                  indices.insert(index);
                              }};
        }
        CHECK(indices == std::set<std::size_t>{0, 1, 2, 3, 4});
    }

    SECTION("At least one thread") {
        std::atomic<std::size_t> calls{0};
        {
            WorkerGroup group{0, [&calls](std::size_t) { ++calls; }};
            CHECK(group.NumberOfThreads() == 1);
        }
        CHECK(calls == 1);
    }
}
