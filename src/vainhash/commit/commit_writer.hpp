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

#ifndef INCLUDED_SRC_VAINHASH_COMMIT_COMMIT_WRITER_HPP
#define INCLUDED_SRC_VAINHASH_COMMIT_COMMIT_WRITER_HPP

#include "gsl/gsl"
#include "src/utils/cpp/expected.hpp"
#include "src/vainhash/commit/commit_store.hpp"
#include "src/vainhash/commit/commit_template.hpp"
#include "src/vainhash/commit/timestamp.hpp"
#include "src/vainhash/common/vain_error.hpp"
#include "src/vainhash/crypto/hasher.hpp"

/// \brief Writes the winning candidate back, after the store confirmed the
/// digest computed by the search.
class CommitWriter final {
  public:
    struct Outcome {
        Hasher::HashDigest id;
        bool replaced{};
    };

    CommitWriter(gsl::not_null<ICommitStore*> const& store,
                 bool dry_run) noexcept
        : store_{store}, dry_run_{dry_run} {}

    /// \brief Render the candidate, verify its id with the store and, unless
    /// in dry-run mode, replace the commit `original_id` with it.
    [[nodiscard]] auto Write(CommitTemplate const& commit,
                             OffsetPair const& offsets,
                             Hasher::HashDigest const& expected_id,
                             Hasher::HashDigest const& original_id) const
        -> expected<Outcome, VainError>;

  private:
    gsl::not_null<ICommitStore*> store_;
    bool dry_run_;
};

#endif  // INCLUDED_SRC_VAINHASH_COMMIT_COMMIT_WRITER_HPP
