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

#ifndef INCLUDED_SRC_VAINHASH_MAIN_RESULT_DUMP_HPP
#define INCLUDED_SRC_VAINHASH_MAIN_RESULT_DUMP_HPP

#include <filesystem>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "src/vainhash/search/search_context.hpp"
#include "src/vainhash/search/search_coordinator.hpp"

/// \brief Everything known about a finished run.
struct SearchReport {
    std::string pattern;
    std::string original_id;
    std::optional<SearchResult> result{};
    SearchStatistics statistics{};
    bool dry_run{false};
    bool replaced{false};
};

[[nodiscard]] auto SearchReportToJson(SearchReport const& report)
    -> nlohmann::json;

/// \brief Write the report as JSON. Returns false (after logging) on failure.
[[nodiscard]] auto DumpSearchReport(SearchReport const& report,
                                    std::filesystem::path const& file_path)
    -> bool;

#endif  // INCLUDED_SRC_VAINHASH_MAIN_RESULT_DUMP_HPP
