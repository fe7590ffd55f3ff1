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

#ifndef INCLUDED_TEST_VAINHASH_COMMIT_FAKE_COMMIT_STORE_HPP
#define INCLUDED_TEST_VAINHASH_COMMIT_FAKE_COMMIT_STORE_HPP

#include <optional>
#include <string>
#include <utility>

#include "src/vainhash/commit/commit_store.hpp"
#include "src/vainhash/crypto/git_object_hash.hpp"

/// \brief In-memory commit store hashing like git. Records all calls.
class FakeCommitStore final : public ICommitStore {
  public:
    explicit FakeCommitStore(std::string content,
                             std::optional<std::string> default_pattern =
                                 std::nullopt)
        : content_{std::move(content)},
          default_pattern_{std::move(default_pattern)} {}

    /// \brief Make VerifyHash report the digest of other content.
    void CorruptVerification() noexcept { corrupt_ = true; }

    [[nodiscard]] auto Content() const -> std::string const& {
        return content_;
    }
    [[nodiscard]] auto VerifyCalls() const noexcept -> int {
        return verify_calls_;
    }
    [[nodiscard]] auto ReplaceCalls() const noexcept -> int {
        return replace_calls_;
    }

    [[nodiscard]] auto ReadCurrent()
        -> expected<StoredCommit, VainError> final {
        return StoredCommit{.content = content_,
                            .id = HashGitCommit(content_)};
    }

    [[nodiscard]] auto VerifyHash(std::string const& content)
        -> expected<Hasher::HashDigest, VainError> final {
        ++verify_calls_;
        if (corrupt_) {
            return HashGitCommit(content + "\n");
        }
        return HashGitCommit(content);
    }

    [[nodiscard]] auto ReplaceCurrent(std::string const& content,
                                      Hasher::HashDigest const& expected_id,
                                      Hasher::HashDigest const& replaced_id)
        -> expected<Hasher::HashDigest, VainError> final {
        ++replace_calls_;
        auto id = HashGitCommit(content);
        if (not(id == expected_id)) {
            return MakeVainError(VainError::Kind::StoreFailure,
                                 "unexpected object id");
        }
        if (not(HashGitCommit(content_) == replaced_id)) {
            return MakeVainError(VainError::Kind::StoreFailure,
                                 "current commit has changed");
        }
        content_ = content;
        return id;
    }

    [[nodiscard]] auto ReadDefaultPattern()
        -> expected<std::optional<std::string>, VainError> final {
        return default_pattern_;
    }

  private:
    std::string content_;
    std::optional<std::string> default_pattern_;
    bool corrupt_{};
    int verify_calls_{};
    int replace_calls_{};
};

#endif  // INCLUDED_TEST_VAINHASH_COMMIT_FAKE_COMMIT_STORE_HPP
