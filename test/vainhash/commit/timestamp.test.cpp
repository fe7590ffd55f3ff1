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

#include "src/vainhash/commit/timestamp.hpp"

#include <optional>
#include <string>

#include "catch2/catch_test_macros.hpp"

TEST_CASE("Timestamp parsing", "[commit]") {
    SECTION("valid digits") {
        auto time = Timestamp::FromDigits("1721827347");
        REQUIRE(time);
        CHECK(time->Value() == 1721827347);
        CHECK(time->Width() == 10);

        auto zero = Timestamp::FromDigits("0");
        REQUIRE(zero);
        CHECK(zero->Value() == 0);
        CHECK(zero->Width() == 1);
    }

    SECTION("rejected digits") {
        CHECK_FALSE(Timestamp::FromDigits(""));
        CHECK_FALSE(Timestamp::FromDigits("12a4"));
        CHECK_FALSE(Timestamp::FromDigits("-12"));
        CHECK_FALSE(Timestamp::FromDigits("0123"));
        CHECK_FALSE(
            Timestamp::FromDigits(std::string(Timestamp::kMaxWidth + 1, '1')));
        CHECK(Timestamp::FromDigits(std::string(Timestamp::kMaxWidth, '9')));
    }
}

TEST_CASE("Timestamp shifting keeps the width", "[commit]") {
    SECTION("inside the width range") {
        auto time = Timestamp::FromDigits("1721827347");
        REQUIRE(time);
        CHECK(time->Shift(0) == 1721827347);
        CHECK(time->Shift(-3600) == 1721823747);
        CHECK(time->Render(5) == std::optional<std::string>{"1721827352"});
        CHECK(time->Render() == std::optional<std::string>{"1721827347"});
    }

    SECTION("upper edge") {
        auto time = Timestamp::FromDigits("9999999998");
        REQUIRE(time);
        CHECK(time->Shift(1) == 9999999999);
        CHECK_FALSE(time->Shift(2));
        CHECK_FALSE(time->Render(2));
    }

    SECTION("lower edge") {
        auto time = Timestamp::FromDigits("1000000001");
        REQUIRE(time);
        CHECK(time->Shift(-1) == 1000000000);
        CHECK_FALSE(time->Shift(-2));
    }

    SECTION("single digit never becomes negative") {
        auto time = Timestamp::FromDigits("3");
        REQUIRE(time);
        CHECK(time->Shift(-3) == 0);
        CHECK(time->Shift(6) == 9);
        CHECK_FALSE(time->Shift(-4));
        CHECK_FALSE(time->Shift(7));
    }
}
