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

#include "src/vainhash/system/cpu.hpp"

#include <filesystem>
#include <fstream>

#include "catch2/catch_test_macros.hpp"
#include "test/utils/test_tmp_dir.hpp"

TEST_CASE("Count kernel cpu lists", "[system]") {
    CHECK(Cpu::CountCpuList("0") == 1);
    CHECK(Cpu::CountCpuList("0-15\n") == 16);
    CHECK(Cpu::CountCpuList("0-7,16,18-19") == 11);
    CHECK(Cpu::CountCpuList("2,4,6") == 3);

    CHECK_FALSE(Cpu::CountCpuList(""));
    CHECK_FALSE(Cpu::CountCpuList("\n"));
    CHECK_FALSE(Cpu::CountCpuList("a-b"));
    CHECK_FALSE(Cpu::CountCpuList("7-3"));
    CHECK_FALSE(Cpu::CountCpuList("1,,2"));
}

TEST_CASE("Performance cores", "[system]") {
    auto const tmp = CreateTestDir();
    REQUIRE(tmp);
    auto const& dir = tmp->GetPath();

    SECTION("from cpu list") {
        auto const list = dir / "cpus";
        {
            std::ofstream file{list};
            file << "0-5\n";
        }
        CHECK(Cpu::PerformanceCores(list) == 6);
    }

    SECTION("without cpu list") {
        CHECK(Cpu::PerformanceCores(dir / "missing") > 0);
    }
}
