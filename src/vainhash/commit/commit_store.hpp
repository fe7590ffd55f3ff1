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

#ifndef INCLUDED_SRC_VAINHASH_COMMIT_COMMIT_STORE_HPP
#define INCLUDED_SRC_VAINHASH_COMMIT_COMMIT_STORE_HPP

#include <optional>
#include <string>

#include "src/utils/cpp/expected.hpp"
#include "src/vainhash/common/vain_error.hpp"
#include "src/vainhash/crypto/hasher.hpp"

/// \brief Commit currently checked out, as read from the store.
struct StoredCommit {
    std::string content;
    Hasher::HashDigest id;
};

/// \brief Access to the repository holding the commit to rewrite.
/// All failures are reported as VainError::Kind::StoreFailure.
class ICommitStore {
  public:
    ICommitStore() = default;
    ICommitStore(ICommitStore const&) = delete;
    ICommitStore(ICommitStore&&) = delete;
    auto operator=(ICommitStore const&) -> ICommitStore& = delete;
    auto operator=(ICommitStore&&) -> ICommitStore& = delete;
    virtual ~ICommitStore() = default;

    /// \brief Raw content and id of the commit HEAD points to.
    [[nodiscard]] virtual auto ReadCurrent()
        -> expected<StoredCommit, VainError> = 0;

    /// \brief Id the store itself assigns to the given commit content. No
    /// object is written.
    [[nodiscard]] virtual auto VerifyHash(std::string const& content)
        -> expected<Hasher::HashDigest, VainError> = 0;

    /// \brief Write the commit content and move HEAD (or the branch it
    /// refers to) from `replaced_id` to it. Fails without moving anything if
    /// the stored object id differs from `expected_id` or HEAD no longer
    /// points to `replaced_id`.
    [[nodiscard]] virtual auto ReplaceCurrent(
        std::string const& content,
        Hasher::HashDigest const& expected_id,
        Hasher::HashDigest const& replaced_id)
        -> expected<Hasher::HashDigest, VainError> = 0;

    /// \brief Pattern configured as default for the repository, if any.
    [[nodiscard]] virtual auto ReadDefaultPattern()
        -> expected<std::optional<std::string>, VainError> = 0;
};

#endif  // INCLUDED_SRC_VAINHASH_COMMIT_COMMIT_STORE_HPP
