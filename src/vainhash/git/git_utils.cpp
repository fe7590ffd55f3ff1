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

#include "src/vainhash/git/git_utils.hpp"

#include <string_view>

#include "fmt/core.h"
#include "src/vainhash/logging/log_level.hpp"
#include "src/vainhash/logging/logger.hpp"

extern "C" {
#include <git2.h>
}

static_assert(GIT_OID_RAWSZ == Hasher::kDigestLength);

namespace {
class LibGit2Guard final {
  public:
    LibGit2Guard() noexcept : initialized_{git_libgit2_init() >= 0} {
        if (not initialized_) {
            Logger::Log(LogLevel::Error, "initializing libgit2 failed");
        }
    }
    LibGit2Guard(LibGit2Guard const&) = delete;
    LibGit2Guard(LibGit2Guard&&) = delete;
    auto operator=(LibGit2Guard const&) -> LibGit2Guard& = delete;
    auto operator=(LibGit2Guard&&) -> LibGit2Guard& = delete;
    ~LibGit2Guard() noexcept {
        if (initialized_) {
            git_libgit2_shutdown();
        }
    }

    [[nodiscard]] auto Initialized() const noexcept -> bool {
        return initialized_;
    }

  private:
    bool initialized_;
};
}  // namespace

auto EnsureLibGit2Initialized() noexcept -> bool {
    static LibGit2Guard const guard{};
    return guard.Initialized();
}

auto GitLastError() noexcept -> std::string {
    git_error const* const err = git_error_last();
    if (err != nullptr and err->message != nullptr) {
        return fmt::format("error code {}: {}", err->klass, err->message);
    }
    return "<unknown error>";
}

auto GitObjectID(Hasher::HashDigest const& digest) noexcept
    -> std::optional<git_oid> {
    git_oid oid{};
    if (git_oid_fromraw(&oid, digest.Raw().data()) == 0) {
        return oid;
    }
    Logger::Log(LogLevel::Error,
                "parsing git object id {} failed with:\n{}",
                digest.HexString(),
                GitLastError());
    return std::nullopt;
}

auto DigestFromGitObjectID(git_oid const& oid) noexcept
    -> std::optional<Hasher::HashDigest> {
    return Hasher::HashDigest::FromRaw(std::string_view{
        reinterpret_cast<char const*>(oid.id),  // NOLINT
        GIT_OID_RAWSZ});
}

void repository_closer(gsl::owner<git_repository*> repository) {
    git_repository_free(repository);
}

void odb_closer(gsl::owner<git_odb*> odb) {
    git_odb_free(odb);
}

void odb_object_closer(gsl::owner<git_odb_object*> object) {
    git_odb_object_free(object);
}

void reference_closer(gsl::owner<git_reference*> reference) {
    git_reference_free(reference);
}

void config_closer(gsl::owner<git_config*> cfg) {
    git_config_free(cfg);
}
