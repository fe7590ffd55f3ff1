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

#include "src/vainhash/main/result_dump.hpp"

#include <exception>
#include <fstream>

#include "src/vainhash/logging/log_level.hpp"
#include "src/vainhash/logging/logger.hpp"

auto SearchReportToJson(SearchReport const& report) -> nlohmann::json {
    auto json = nlohmann::json::object();
    json["pattern"] = report.pattern;
    json["original"] = report.original_id;
    json["found"] = report.result.has_value();
    if (report.result) {
        json["index"] = report.result->index;
        json["delta_author"] = report.result->offsets.delta_author;
        json["delta_committer"] = report.result->offsets.delta_committer;
        json["hash"] = report.result->digest.HexString();
    }
    json["dry_run"] = report.dry_run;
    json["replaced"] = report.replaced;
    json["statistics"] = {{"tried", report.statistics.tried},
                          {"skipped", report.statistics.skipped},
                          {"jobs", report.statistics.jobs},
                          {"seconds", report.statistics.elapsed.count()}};
    return json;
}

auto DumpSearchReport(SearchReport const& report,
                      std::filesystem::path const& file_path) -> bool {
    try {
        std::ofstream os(file_path);
        os << SearchReportToJson(report).dump(2) << std::endl;
        if (not os) {
            Logger::Log(LogLevel::Error,
                        "Writing search result to {} failed",
                        file_path.string());
            return false;
        }
        return true;
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Error,
                    "Dumping search result to {} failed with:\n{}",
                    file_path.string(),
                    ex.what());
    }
    return false;
}
