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

#ifndef INCLUDED_SRC_VAINHASH_LOGGING_LOG_SINK_FILE_HPP
#define INCLUDED_SRC_VAINHASH_LOGGING_LOG_SINK_FILE_HPP

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <exception>
#include <filesystem>
#include <iterator>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include "fmt/chrono.h"
#include "fmt/core.h"
#include "gsl/gsl"
#include "src/vainhash/logging/log_sink.hpp"
#include "src/vainhash/logging/logger.hpp"

/// \brief Sink appending time-stamped messages to a log file.
/// All instances share one mutex, as only a single log file is expected per
/// run of the tool.
class LogSinkFile final : public ILogSink {
  public:
    enum class Mode : std::uint8_t {
        Append,    ///< Append if log file already exists.
        Overwrite  ///< Truncate log file when the sink is created.
    };

    static auto CreateFactory(std::filesystem::path const& file_path,
                              Mode file_mode = Mode::Append) -> LogSinkFactory {
        return
            [=] { return std::make_shared<LogSinkFile>(file_path, file_mode); };
    }

    LogSinkFile(std::filesystem::path const& file_path, Mode file_mode)
        : file_path_{std::filesystem::weakly_canonical(file_path).string()} {
        if (file_mode == Mode::Overwrite) {
            std::lock_guard lock{FileMutex()};
            if (gsl::owner<FILE*> file = std::fopen(file_path_.c_str(), "w")) {
                std::fclose(file);
            }
        }
    }
    ~LogSinkFile() noexcept final = default;
    LogSinkFile(LogSinkFile const&) noexcept = delete;
    LogSinkFile(LogSinkFile&&) noexcept = delete;
    auto operator=(LogSinkFile const&) noexcept -> LogSinkFile& = delete;
    auto operator=(LogSinkFile&&) noexcept -> LogSinkFile& = delete;

    void Emit(Logger const* logger,
              LogLevel level,
              std::string const& msg) const noexcept final {
        try {
            auto timestamp = fmt::format("{:%Y-%m-%d %H:%M:%S}",
                                         fmt::localtime(std::time(nullptr)));

            std::ostringstream id{};
            id << "thread:" << std::this_thread::get_id();

            auto prefix = fmt::format(
                "{}, [{}] {}", id.str(), timestamp, LogLevelToString(level));
            if (logger != nullptr) {
                prefix = fmt::format("{} ({})", prefix, logger->Name());
            }
            prefix = fmt::format("{}:", prefix);
            auto const* cont_prefix = "  ";

            std::lock_guard lock{FileMutex()};
            if (gsl::owner<FILE*> file = std::fopen(file_path_.c_str(), "a")) {
                using it = std::istream_iterator<ILogSink::Line>;
                std::istringstream iss{msg};
                std::for_each(it{iss}, it{}, [&](auto const& line) {
                    fmt::print(file, "{} {}\n", prefix, line);
                    prefix = cont_prefix;
                });
                std::fclose(file);
            }
        } catch (std::exception const& e) {
            std::fprintf(stderr,
                         "writing to log file %s failed with: %s\n",
                         file_path_.c_str(),
                         e.what());
        }
    }

  private:
    std::string file_path_;

    [[nodiscard]] static auto FileMutex() noexcept -> std::mutex& {
        static std::mutex mutex{};
        return mutex;
    }
};

#endif  // INCLUDED_SRC_VAINHASH_LOGGING_LOG_SINK_FILE_HPP
