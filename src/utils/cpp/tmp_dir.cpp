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

#include "src/utils/cpp/tmp_dir.hpp"

#ifdef __unix__
#include <unistd.h>
#else
#error "Non-unix is not supported yet"
#endif

#include <cstdlib>
#include <exception>
#include <string>
#include <string_view>
#include <system_error>

#include "src/vainhash/logging/log_level.hpp"
#include "src/vainhash/logging/logger.hpp"

auto TmpDir::Create(std::filesystem::path const& prefix) noexcept -> Ptr {
    static constexpr std::string_view kDirTemplate = "tmp.XXXXXX";
    std::string file_path;
    try {
        // make sure prefix folder exists
        std::error_code ec{};
        std::filesystem::create_directories(prefix, ec);
        if (ec) {
            Logger::Log(LogLevel::Error,
                        "TmpDir: could not create prefix directory {}: {}",
                        prefix.string(),
                        ec.message());
            return nullptr;
        }
        file_path = std::filesystem::weakly_canonical(prefix / kDirTemplate);
        if (mkdtemp(file_path.data()) == nullptr) {
            return nullptr;
        }
        return std::shared_ptr<TmpDir const>(new TmpDir(file_path));
    } catch (std::exception const& e) {
        Logger::Log(LogLevel::Error,
                    "TmpDir: creating directory in {} failed: {}",
                    prefix.string(),
                    e.what());
        if (not file_path.empty()) {
            rmdir(file_path.c_str());
        }
    }
    return nullptr;
}

TmpDir::~TmpDir() noexcept {
    // try to remove the tmp dir and all its content
    std::error_code ec{};
    std::filesystem::remove_all(tmp_dir_, ec);
}
