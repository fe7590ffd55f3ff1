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

#ifndef INCLUDED_SRC_VAINHASH_SYSTEM_CPU_HPP
#define INCLUDED_SRC_VAINHASH_SYSTEM_CPU_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>

namespace Cpu {

/// \brief Number of threads used if nothing better is known.
constexpr std::size_t kFallbackCores = 8;

/// \brief Number of CPUs in a kernel cpu list such as "0-7,16,18-19".
[[nodiscard]] auto CountCpuList(std::string_view list) noexcept
    -> std::optional<std::size_t>;

/// \brief Number of performance cores. On hybrid systems the kernel lists
/// them in `core_list`; otherwise all hardware threads are counted, and
/// kFallbackCores is returned if that fails as well.
[[nodiscard]] auto PerformanceCores(
    std::filesystem::path const& core_list =
        "/sys/devices/cpu_core/cpus") noexcept -> std::size_t;

}  // namespace Cpu

#endif  // INCLUDED_SRC_VAINHASH_SYSTEM_CPU_HPP
