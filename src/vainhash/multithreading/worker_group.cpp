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

#include <utility>

WorkerGroup::WorkerGroup(std::size_t number_of_threads, Worker worker)
    : thread_count_{std::max(std::size_t{1}, number_of_threads)},
      worker_{std::move(worker)} {
    threads_.reserve(thread_count_);
    for (std::size_t index = 0; index < thread_count_; ++index) {
        threads_.emplace_back([this, index]() { worker_(index); });
    }
}

WorkerGroup::~WorkerGroup() {
    for (auto& t : threads_) {
        t.join();
    }
}
