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

#ifndef INCLUDED_SRC_VAINHASH_CRYPTO_GIT_OBJECT_HASH_HPP
#define INCLUDED_SRC_VAINHASH_CRYPTO_GIT_OBJECT_HASH_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include "src/vainhash/crypto/hasher.hpp"

/// \brief Header git prepends to an object's content before hashing:
/// "<type> <decimal size>\0".
[[nodiscard]] auto CreateGitObjectTag(std::string_view type,
                                      std::size_t size) -> std::string;

/// \brief Hasher already fed with the tag of a commit of the given size.
[[nodiscard]] auto MakeGitCommitHasher(std::size_t content_size) -> Hasher;

/// \brief Object id git assigns to a commit with the given content.
/// same as: git hash-object -t commit --stdin
[[nodiscard]] auto HashGitCommit(std::string_view content)
    -> Hasher::HashDigest;

#endif  // INCLUDED_SRC_VAINHASH_CRYPTO_GIT_OBJECT_HASH_HPP
