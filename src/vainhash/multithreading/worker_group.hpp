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

#ifndef INCLUDED_SRC_VAINHASH_MULTITHREADING_WORKER_GROUP_HPP
#define INCLUDED_SRC_VAINHASH_MULTITHREADING_WORKER_GROUP_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

/// \brief Fixed number of threads, each running the same function with its
/// own index in [0, NumberOfThreads()).
class WorkerGroup {
  public:
    using Worker = std::function<void(std::size_t)>;

    // Constructor immediately starts `number_of_threads` threads (at least
    // one) running `worker(index)`
    WorkerGroup(std::size_t number_of_threads, Worker worker);

    WorkerGroup(WorkerGroup const&) = delete;
    WorkerGroup(WorkerGroup&&) = delete;
    auto operator=(WorkerGroup const&) -> WorkerGroup& = delete;
    auto operator=(WorkerGroup&&) -> WorkerGroup& = delete;

    // Destructor joins all threads, i.e., waits for every worker function to
    // return
    ~WorkerGroup();

    [[nodiscard]] auto NumberOfThreads() const noexcept -> std::size_t {
        return thread_count_;
    }

  private:
    std::size_t const thread_count_;
    Worker worker_;
    std::vector<std::thread> threads_{};
};

#endif  // INCLUDED_SRC_VAINHASH_MULTITHREADING_WORKER_GROUP_HPP
