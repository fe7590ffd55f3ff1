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

#ifndef INCLUDED_SRC_VAINHASH_LOGGING_LOGGER_HPP
#define INCLUDED_SRC_VAINHASH_LOGGING_LOGGER_HPP

#include <algorithm>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "fmt/core.h"
#include "src/vainhash/logging/log_config.hpp"
#include "src/vainhash/logging/log_level.hpp"
#include "src/vainhash/logging/log_sink.hpp"

/// \brief Named logger writing to the sinks of LogConfig.
/// Static Log() is used for messages without a specific origin.
class Logger {
  public:
    using MessageCreateFunc = std::function<std::string()>;

    explicit Logger(std::string name) noexcept
        : name_{std::move(name)}, sinks_{LogConfig::Sinks()} {}

    ~Logger() noexcept = default;
    Logger(Logger const&) noexcept = delete;
    Logger(Logger&&) noexcept = delete;
    auto operator=(Logger const&) noexcept -> Logger& = delete;
    auto operator=(Logger&&) noexcept -> Logger& = delete;

    [[nodiscard]] auto Name() const& noexcept -> std::string const& {
        return name_;
    }

    /// \brief Emit log message from format string via this logger instance.
    template <class... T_Args>
    void Emit(LogLevel level,
              std::string const& msg,
              T_Args&&... args) const noexcept {
        if (IsEnabled(level)) {
            FormatAndForward(
                this, sinks_, level, msg, std::forward<T_Args>(args)...);
        }
    }

    /// \brief Emit log message from lambda via this logger instance.
    /// The lambda is only called if the level is enabled.
    void Emit(LogLevel level,
              MessageCreateFunc const& msg_creator) const noexcept {
        if (IsEnabled(level)) {
            FormatAndForward(this, sinks_, level, msg_creator());
        }
    }

    /// \brief Log message from format string via LogConfig's sinks.
    template <class... T_Args>
    static void Log(LogLevel level,
                    std::string const& msg,
                    T_Args&&... args) noexcept {
        if (IsEnabled(level)) {
            FormatAndForward(nullptr,
                             LogConfig::Sinks(),
                             level,
                             msg,
                             std::forward<T_Args>(args)...);
        }
    }

    static void Log(LogLevel level,
                    MessageCreateFunc const& msg_creator) noexcept {
        if (IsEnabled(level)) {
            FormatAndForward(nullptr, LogConfig::Sinks(), level, msg_creator());
        }
    }

    [[nodiscard]] static auto IsEnabled(LogLevel level) noexcept -> bool {
        return static_cast<int>(level) <=
               static_cast<int>(LogConfig::LogLimit());
    }

  private:
    std::string name_;
    std::vector<ILogSink::Ptr> sinks_;

    template <class... T_Args>
    static void FormatAndForward(Logger const* logger,
                                 std::vector<ILogSink::Ptr> const& sinks,
                                 LogLevel level,
                                 std::string const& msg,
                                 T_Args&&... args) noexcept {
        if constexpr (sizeof...(T_Args) == 0) {
            std::for_each(sinks.cbegin(), sinks.cend(), [&](auto const& sink) {
                sink->Emit(logger, level, msg);
            });
        }
        else {
            std::string fmsg{};
            try {
                fmsg = fmt::vformat(msg, fmt::make_format_args(args...));
            } catch (fmt::format_error const& e) {
                fmsg = fmt::format("{} [format error: {}]", msg, e.what());
            }
            FormatAndForward(logger, sinks, level, fmsg);
        }
    }
};

#endif  // INCLUDED_SRC_VAINHASH_LOGGING_LOGGER_HPP
