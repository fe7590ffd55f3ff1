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

#ifndef INCLUDED_TEST_UTILS_TEST_TMP_DIR_HPP
#define INCLUDED_TEST_UTILS_TEST_TMP_DIR_HPP

#include <cstdlib>
#include <filesystem>

#include "src/utils/cpp/tmp_dir.hpp"

/// \brief Fresh directory below TEST_TMPDIR, or below the system's temporary
/// directory if the test launcher did not set it.
[[nodiscard]] static inline auto CreateTestDir() -> TmpDir::Ptr {
    auto* tmp_dir = std::getenv("TEST_TMPDIR");
    auto const prefix = tmp_dir != nullptr
                            ? std::filesystem::path{tmp_dir}
                            : std::filesystem::temp_directory_path() /
                                  "vainhash_tests";
    return TmpDir::Create(prefix);
}

#endif  // INCLUDED_TEST_UTILS_TEST_TMP_DIR_HPP
