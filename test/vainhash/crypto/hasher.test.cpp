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

#include "src/vainhash/crypto/hasher.hpp"

#include <string>
#include <utility>

#include "catch2/catch_test_macros.hpp"

TEST_CASE("Hasher", "[crypto]") {
    std::string bytes{"test"};

    SECTION("incremental updates") {
        // same as: echo -n test | sha1sum
        Hasher hasher{};
        hasher.Update(bytes.substr(0, bytes.size() / 2));
        hasher.Update(bytes.substr(bytes.size() / 2));
        CHECK(std::move(hasher).Finalize().HexString() ==
              "a94a8fe5ccb19ba61c4c0873d391e987982fbbd3");
    }

    SECTION("copies continue independently") {
        Hasher prefix{};
        prefix.Update("te");

        auto first = prefix;
        first.Update("st");
        auto second = prefix;
        second.Update("st");
        auto other = prefix;
        other.Update("xt");

        auto first_digest = std::move(first).Finalize();
        CHECK(first_digest.HexString() ==
              "a94a8fe5ccb19ba61c4c0873d391e987982fbbd3");
        CHECK(std::move(second).Finalize() == first_digest);
        CHECK(not(std::move(other).Finalize() == first_digest));
    }
}

TEST_CASE("HashDigest", "[crypto]") {
    std::string const hex{"a94a8fe5ccb19ba61c4c0873d391e987982fbbd3"};

    SECTION("from hex") {
        auto digest = Hasher::HashDigest::FromHex(hex);
        REQUIRE(digest);
        CHECK(digest->HexString() == hex);
        CHECK(digest->Raw()[0] == 0xa9);
        CHECK(digest->Raw()[19] == 0xd3);

        auto upper = Hasher::HashDigest::FromHex(
            "A94A8FE5CCB19BA61C4C0873D391E987982FBBD3");
        REQUIRE(upper);
        CHECK(*upper == *digest);
    }

    SECTION("invalid hex") {
        CHECK_FALSE(Hasher::HashDigest::FromHex(hex.substr(1)));
        CHECK_FALSE(Hasher::HashDigest::FromHex(hex + "00"));
        CHECK_FALSE(Hasher::HashDigest::FromHex(
            "g94a8fe5ccb19ba61c4c0873d391e987982fbbd3"));
    }

    SECTION("from raw") {
        CHECK_FALSE(Hasher::HashDigest::FromRaw("too short"));
        auto digest = Hasher::HashDigest::FromRaw(std::string(20, '\xff'));
        REQUIRE(digest);
        CHECK(digest->HexString() == std::string(40, 'f'));
    }
}
