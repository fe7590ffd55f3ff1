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

#ifndef INCLUDED_SRC_VAINHASH_LOGGING_LOG_LEVEL_HPP
#define INCLUDED_SRC_VAINHASH_LOGGING_LOG_LEVEL_HPP

#include <algorithm>
#include <string>
#include <type_traits>

#include "gsl/gsl"

enum class LogLevel {
    Error,     ///< Error messages, fatal errors
    Warning,   ///< Warning messages, recoverable situations worth attention
    Info,      ///< Informative messages, such as the search target or result
    Progress,  ///< Periodic information about the running search
    Debug,     ///< Debug messages, such as parse offsets and worker states
    Trace      ///< Trace messages, verbose details of single candidates
};

constexpr auto kFirstLogLevel = LogLevel::Error;
constexpr auto kLastLogLevel = LogLevel::Trace;
constexpr auto kDefaultLogLevel = LogLevel::Progress;

/// \brief Clamp a numeric log level given on the command line.
[[nodiscard]] static inline auto ToLogLevel(
    std::underlying_type_t<LogLevel> level) -> LogLevel {
    return std::min(std::max(static_cast<LogLevel>(level), kFirstLogLevel),
                    kLastLogLevel);
}

[[nodiscard]] static inline auto LogLevelToString(LogLevel level)
    -> std::string {
    switch (level) {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Progress:
            return "PROG";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
    }
    Ensures(false);  // unreachable
}

#endif  // INCLUDED_SRC_VAINHASH_LOGGING_LOG_LEVEL_HPP
