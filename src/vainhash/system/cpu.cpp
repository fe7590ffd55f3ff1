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

#include "src/vainhash/system/cpu.hpp"

#include <charconv>
#include <exception>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>

#include "src/vainhash/logging/log_level.hpp"
#include "src/vainhash/logging/logger.hpp"

namespace {
[[nodiscard]] auto ParseNumber(std::string_view str) noexcept
    -> std::optional<std::size_t> {
    std::size_t value{};
    auto const* end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), end, value);
    if (ec != std::errc{} or ptr != end) {
        return std::nullopt;
    }
    return value;
}
}  // namespace

namespace Cpu {

auto CountCpuList(std::string_view list) noexcept
    -> std::optional<std::size_t> {
    while (not list.empty() and
           (list.back() == '\n' or list.back() == ' ')) {
        list.remove_suffix(1);
    }
    if (list.empty()) {
        return std::nullopt;
    }
    std::size_t count{};
    while (not list.empty()) {
        auto const comma = list.find(',');
        auto const range = list.substr(0, comma);
        list = comma == std::string_view::npos ? std::string_view{}
                                               : list.substr(comma + 1);
        auto const dash = range.find('-');
        if (dash == std::string_view::npos) {
            if (not ParseNumber(range)) {
                return std::nullopt;
            }
            ++count;
            continue;
        }
        auto const first = ParseNumber(range.substr(0, dash));
        auto const last = ParseNumber(range.substr(dash + 1));
        if (not first or not last or *last < *first) {
            return std::nullopt;
        }
        count += *last - *first + 1;
    }
    return count;
}

auto PerformanceCores(std::filesystem::path const& core_list) noexcept
    -> std::size_t {
    try {
        std::ifstream file{core_list};
        std::string content{};
        if (file and std::getline(file, content)) {
            if (auto count = CountCpuList(content); count and *count > 0) {
                Logger::Log(LogLevel::Debug,
                            "Found {} performance cores in {}",
                            *count,
                            core_list.string());
                return *count;
            }
        }
    } catch (std::exception const& e) {
        Logger::Log(LogLevel::Debug,
                    "Reading {} failed: {}",
                    core_list.string(),
                    e.what());
    }
    if (auto const threads = std::thread::hardware_concurrency();
        threads > 0) {
        return threads;
    }
    return kFallbackCores;
}

}  // namespace Cpu
