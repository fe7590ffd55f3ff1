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

#ifndef INCLUDED_SRC_VAINHASH_GIT_GIT_UTILS_HPP
#define INCLUDED_SRC_VAINHASH_GIT_GIT_UTILS_HPP

#include <optional>
#include <string>

#include "gsl/gsl"
#include "src/vainhash/crypto/hasher.hpp"

extern "C" {
struct git_oid;
struct git_odb;
struct git_odb_object;
struct git_repository;
struct git_reference;
struct git_config;
}

/// \brief Initialize libgit2 once for the lifetime of the process.
/// The library is shut down again at static destruction. Returns false if the
/// initialization failed; later calls report the same result.
[[nodiscard]] auto EnsureLibGit2Initialized() noexcept -> bool;

/// \brief Retrieve error message of last libgit2 call.
[[nodiscard]] auto GitLastError() noexcept -> std::string;

[[nodiscard]] auto GitObjectID(Hasher::HashDigest const& digest) noexcept
    -> std::optional<git_oid>;

[[nodiscard]] auto DigestFromGitObjectID(git_oid const& oid) noexcept
    -> std::optional<Hasher::HashDigest>;

void repository_closer(gsl::owner<git_repository*> repository);

void odb_closer(gsl::owner<git_odb*> odb);

void odb_object_closer(gsl::owner<git_odb_object*> object);

void reference_closer(gsl::owner<git_reference*> reference);

void config_closer(gsl::owner<git_config*> cfg);

#endif  // INCLUDED_SRC_VAINHASH_GIT_GIT_UTILS_HPP
