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

#include "src/vainhash/crypto/git_object_hash.hpp"

#include <utility>

auto CreateGitObjectTag(std::string_view type, std::size_t size)
    -> std::string {
    return std::string{type} + ' ' + std::to_string(size) + '\0';
}

auto MakeGitCommitHasher(std::size_t content_size) -> Hasher {
    Hasher hasher{};
    hasher.Update(CreateGitObjectTag("commit", content_size));
    return hasher;
}

auto HashGitCommit(std::string_view content) -> Hasher::HashDigest {
    auto hasher = MakeGitCommitHasher(content.size());
    hasher.Update(content);
    return std::move(hasher).Finalize();
}
