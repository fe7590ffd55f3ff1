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

#include "src/vainhash/logging/logger.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "src/vainhash/logging/log_config.hpp"
#include "src/vainhash/logging/log_level.hpp"
#include "src/vainhash/logging/log_sink.hpp"

// Stores prints from test sink instances
class TestPrints {
    struct PrintData {
        std::mutex mutex{};
        int counter{};
        std::unordered_map<int, std::vector<std::string>> prints{};
    };

  public:
    static void Print(int sink_id, std::string const& print) noexcept {
        std::unique_lock lock{Data().mutex};
        Data().prints[sink_id].push_back(print);
    }
    [[nodiscard]] static auto Read(int sink_id) noexcept
        -> std::vector<std::string> {
        std::unique_lock lock{Data().mutex};
        return Data().prints[sink_id];
    }

    static void Clear() noexcept {
        std::unique_lock lock{Data().mutex};
        Data().prints.clear();
        Data().counter = 0;
    }

    static auto GetId() noexcept -> int {
        std::unique_lock lock{Data().mutex};
        return Data().counter++;
    }

  private:
    [[nodiscard]] static auto Data() noexcept -> PrintData& {
        static PrintData instance{};
        return instance;
    }
};

// Test sink, prints to TestPrints depending on its own instance id.
class LogSinkTest : public ILogSink {
  public:
    static auto CreateFactory() -> LogSinkFactory {
        return [] { return std::make_shared<LogSinkTest>(); };
    }

    LogSinkTest() noexcept : id_{TestPrints::GetId()} {}

    void Emit(Logger const* logger,
              LogLevel level,
              std::string const& msg) const noexcept final {
        auto prefix = LogLevelToString(level);
        if (logger != nullptr) {
            prefix += " (" + logger->Name() + ")";
        }
        TestPrints::Print(id_, prefix + ": " + msg);
    }

  private:
    int id_{};
};

class OneGlobalSinkFixture {
  public:
    OneGlobalSinkFixture() {
        TestPrints::Clear();
        LogConfig::SetLogLimit(LogLevel::Info);
        LogConfig::SetSinks({LogSinkTest::CreateFactory()});
    }
};

TEST_CASE_METHOD(OneGlobalSinkFixture,
                 "Global static logger with one sink",
                 "[logging]") {
    // log outside of the limit is dropped
    Logger::Log(LogLevel::Debug, "first");
    CHECK(TestPrints::Read(0).empty());

    SECTION("log within the limit") {
        Logger::Log(LogLevel::Info, "second {}", 2);
        auto prints = TestPrints::Read(0);
        REQUIRE(prints.size() == 1);
        CHECK(prints[0] == "INFO: second 2");
    }

    SECTION("raised limit") {
        LogConfig::SetLogLimit(LogLevel::Trace);
        Logger::Log(LogLevel::Trace, "third");
        auto prints = TestPrints::Read(0);
        REQUIRE(prints.size() == 1);
        CHECK(prints[0] == "TRACE: third");
    }

    SECTION("lazy message creation") {
        bool called = false;
        Logger::Log(LogLevel::Debug, [&called]() {
            called = true;
            return std::string{"not created"};
        });
        CHECK_FALSE(called);
        Logger::Log(LogLevel::Error, [&called]() {
            called = true;
            return std::string{"created"};
        });
        CHECK(called);
        CHECK(TestPrints::Read(0) ==
              std::vector<std::string>{"ERROR: created"});
    }

    SECTION("format errors do not throw") {
        Logger::Log(LogLevel::Info, "missing {} {}", 1);
        auto prints = TestPrints::Read(0);
        REQUIRE(prints.size() == 1);
        CHECK(prints[0].starts_with("INFO: missing {} {} [format error"));
    }
}

TEST_CASE_METHOD(OneGlobalSinkFixture, "Named logger", "[logging]") {
    LogConfig::AddSink(LogSinkTest::CreateFactory());
    Logger const logger{"SearchWorker"};
    logger.Emit(LogLevel::Warning, "stopped after {} candidates", 42);

    for (int instance : {0, 1}) {
        auto prints = TestPrints::Read(instance);
        REQUIRE(prints.size() == 1);
        CHECK(prints[0] ==
              "WARN (SearchWorker): stopped after 42 candidates");
    }
}

TEST_CASE("Log level conversion", "[logging]") {
    CHECK(ToLogLevel(0) == LogLevel::Error);
    CHECK(ToLogLevel(3) == LogLevel::Progress);
    CHECK(ToLogLevel(-1) == kFirstLogLevel);
    CHECK(ToLogLevel(42) == kLastLogLevel);
    CHECK(LogLevelToString(LogLevel::Progress) == "PROG");
}
