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

#include "src/vainhash/search/target_pattern.hpp"

#include <string>

#include "catch2/catch_test_macros.hpp"
#include "src/vainhash/crypto/hasher.hpp"

namespace {
// same as: echo -n howdy | sha1sum
auto const kHowdy =
    Hasher::HashDigest::FromHex("ef42bab1191da272f13935f78c401e3de0c11afb");

[[nodiscard]] auto MatchesHowdy(std::string const& pattern) -> bool {
    auto compiled = TargetPattern::Create(pattern);
    REQUIRE(compiled);
    REQUIRE(kHowdy);
    return compiled->Matches(*kHowdy);
}
}  // namespace

TEST_CASE("Pattern matches digest prefix", "[search]") {
    SECTION("full bytes") {
        CHECK(MatchesHowdy("ef"));
        CHECK(MatchesHowdy("ef42bab1"));
        CHECK_FALSE(MatchesHowdy("ef40bab1"));
        CHECK_FALSE(MatchesHowdy("ef42bab100"));
        CHECK_FALSE(MatchesHowdy("cafe12"));
    }

    SECTION("odd trailing nibble") {
        CHECK(MatchesHowdy("e"));
        CHECK(MatchesHowdy("ef42b"));
        CHECK(MatchesHowdy("ef42bab1191da"));
        CHECK_FALSE(MatchesHowdy("f"));
        CHECK_FALSE(MatchesHowdy("ef42a"));
        CHECK_FALSE(MatchesHowdy("ef02bab1191da"));
    }

    SECTION("upper case") {
        CHECK(MatchesHowdy("EF42B"));
        auto compiled = TargetPattern::Create("EF42B");
        REQUIRE(compiled);
        CHECK(compiled->ToString() == "ef42b");
    }

    SECTION("maximum length") {
        CHECK(MatchesHowdy("ef42bab1191da272"));
        CHECK_FALSE(MatchesHowdy("ef42bab1191da273"));
    }
}

TEST_CASE("Pattern properties", "[search]") {
    auto odd = TargetPattern::Create("abc");
    REQUIRE(odd);
    CHECK(odd->NibbleCount() == 3);
    CHECK(odd->HasOddTrailingNibble());

    auto even = TargetPattern::Create("abcd");
    REQUIRE(even);
    CHECK(even->NibbleCount() == 4);
    CHECK_FALSE(even->HasOddTrailingNibble());
}

TEST_CASE("Invalid patterns", "[search]") {
    auto check_invalid = [](std::string const& pattern) {
        auto compiled = TargetPattern::Create(pattern);
        REQUIRE_FALSE(compiled);
        CHECK(compiled.error().GetKind() == VainError::Kind::InvalidPattern);
    };

    SECTION("not hex") {
        check_invalid("great");
        check_invalid("12 4");
        check_invalid("0x12");
    }

    SECTION("empty") {
        check_invalid("");
    }

    SECTION("too long") {
        check_invalid("ef42bab1191da272f");
        check_invalid(std::string(40, '0'));
    }
}
