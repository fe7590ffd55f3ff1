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

#ifndef INCLUDED_SRC_VAINHASH_MAIN_CLI_HPP
#define INCLUDED_SRC_VAINHASH_MAIN_CLI_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "CLI/CLI.hpp"
#include "fmt/core.h"
#include "gsl/gsl"
#include "src/vainhash/logging/log_level.hpp"
#include "src/vainhash/search/offset_enumerator.hpp"
#include "src/vainhash/search/target_pattern.hpp"

/// \brief Arguments controlling the search and the rewrite.
struct SearchArguments {
    std::optional<std::string> pattern{};
    std::filesystem::path repository{"."};
    std::optional<std::size_t> jobs{};
    std::int64_t bound{OffsetEnumerator::kDefaultBound};
    bool dry_run{false};
    std::optional<std::filesystem::path> dump_result{};
};

/// \brief Arguments required for logging.
struct LogArguments {
    std::vector<std::filesystem::path> log_files{};
    std::optional<LogLevel> log_limit{};
    bool plain_log{false};
    bool log_append{false};
};

struct CommandLineArguments {
    SearchArguments search;
    LogArguments log;
};

static inline void SetupSearchArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<SearchArguments*> const& clargs) {
    app->add_option(
           "pattern",
           clargs->pattern,
           fmt::format("Hex prefix of up to {} characters the new commit id "
                       "should start with (Default: git config vain.default, "
                       "or 1234).",
                       TargetPattern::kMaxNibbles))
        ->type_name("PATTERN");
    app->add_flag("--dry-run",
                  clargs->dry_run,
                  "Search and verify, but do not replace the commit.");
    app->add_option("-C,--repository",
                    clargs->repository,
                    "Path inside the git repository to operate on "
                    "(Default: current directory).")
        ->type_name("PATH");
    app->add_option("-J,--jobs",
                    clargs->jobs,
                    "Number of search threads (Default: number of "
                    "performance cores).")
        ->type_name("NUM")
        ->check(CLI::PositiveNumber);
    app->add_option(
           "--bound",
           clargs->bound,
           fmt::format("Largest timestamp shift in seconds (Default: {}).",
                       OffsetEnumerator::kDefaultBound))
        ->type_name("NUM")
        ->check(CLI::Range(std::int64_t{1}, OffsetEnumerator::kMaxBound));
    app->add_option("--dump-result",
                    clargs->dump_result,
                    "Dump the search result in JSON format to the given file.")
        ->type_name("PATH");
}

static inline void SetupLogArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<LogArguments*> const& clargs) {
    app->add_option_function<std::string>(
           "-f,--log-file",
           [clargs](auto const& log_file_) {
               clargs->log_files.emplace_back(log_file_);
           },
           "Path to local log file.")
        ->type_name("PATH")
        ->trigger_on_parse();  // run callback on all instances while parsing,
                               // not after all parsing is done
    app->add_option_function<std::underlying_type_t<LogLevel>>(
           "--log-limit",
           [clargs](auto const& limit) {
               clargs->log_limit = ToLogLevel(limit);
           },
           fmt::format("Log limit (higher is more verbose) in interval [{},{}] "
                       "(Default: {}).",
                       static_cast<int>(kFirstLogLevel),
                       static_cast<int>(kLastLogLevel),
                       static_cast<int>(kDefaultLogLevel)))
        ->type_name("NUM");
    app->add_flag("--plain-log",
                  clargs->plain_log,
                  "Do not use ANSI escape sequences to highlight messages.");
    app->add_flag(
        "--log-append",
        clargs->log_append,
        "Append messages to log file instead of overwriting existing.");
}

#endif  // INCLUDED_SRC_VAINHASH_MAIN_CLI_HPP
