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

auto SearchContext::Publish(SearchResult const& result) noexcept -> bool {
    bool expected = false;
    if (not found_.compare_exchange_strong(
            expected, true, std::memory_order_acq_rel)) {
        return false;
    }
    {
        std::unique_lock lock{mutex_};
        result_ = result;
    }
    cv_.notify_all();
    return true;
}

void SearchContext::WorkerDone() noexcept {
    bool last = false;
    {
        std::unique_lock lock{mutex_};
        if (live_workers_ > 0) {
            --live_workers_;
        }
        last = live_workers_ == 0;
    }
    if (last) {
        cv_.notify_all();
    }
}

void SearchContext::Wait() noexcept {
    std::unique_lock lock{mutex_};
    cv_.wait(lock,
             [this]() { return result_.has_value() or live_workers_ == 0; });
}

auto SearchContext::Result() const noexcept -> std::optional<SearchResult> {
    std::unique_lock lock{mutex_};
    return result_;
}
