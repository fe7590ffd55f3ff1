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

#ifndef INCLUDED_SRC_VAINHASH_GIT_GIT_COMMIT_STORE_HPP
#define INCLUDED_SRC_VAINHASH_GIT_GIT_COMMIT_STORE_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "src/utils/cpp/expected.hpp"
#include "src/vainhash/commit/commit_store.hpp"
#include "src/vainhash/common/vain_error.hpp"
#include "src/vainhash/crypto/hasher.hpp"

extern "C" {
struct git_repository;
struct git_odb;
}

/// \brief Commit store backed by a git repository through libgit2.
class GitCommitStore final : public ICommitStore {
  public:
    /// \brief Configuration key of the default pattern.
    static constexpr auto kDefaultPatternKey = "vain.default";

    /// \brief Open the repository containing `path`, searching parent
    /// directories like git does.
    [[nodiscard]] static auto Open(std::filesystem::path const& path) noexcept
        -> expected<std::unique_ptr<GitCommitStore>, VainError>;

    [[nodiscard]] auto ReadCurrent()
        -> expected<StoredCommit, VainError> final;

    [[nodiscard]] auto VerifyHash(std::string const& content)
        -> expected<Hasher::HashDigest, VainError> final;

    [[nodiscard]] auto ReplaceCurrent(std::string const& content,
                                      Hasher::HashDigest const& expected_id,
                                      Hasher::HashDigest const& replaced_id)
        -> expected<Hasher::HashDigest, VainError> final;

    [[nodiscard]] auto ReadDefaultPattern()
        -> expected<std::optional<std::string>, VainError> final;

    [[nodiscard]] auto GetPath() const& noexcept
        -> std::filesystem::path const& {
        return path_;
    }

  private:
    std::shared_ptr<git_repository> repo_;
    std::shared_ptr<git_odb> odb_;
    std::filesystem::path path_;

    GitCommitStore(std::shared_ptr<git_repository> repo,
                   std::shared_ptr<git_odb> odb,
                   std::filesystem::path path) noexcept;

    /// \brief Name of the reference to move: the branch HEAD refers to, or
    /// HEAD itself if it is detached.
    [[nodiscard]] auto HeadTarget() const -> expected<std::string, VainError>;
};

#endif  // INCLUDED_SRC_VAINHASH_GIT_GIT_COMMIT_STORE_HPP
