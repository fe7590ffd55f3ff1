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

#include "src/vainhash/search/incremental_hasher.hpp"

#include <utility>

#include "fmt/format.h"
#include "src/vainhash/crypto/git_object_hash.hpp"

IncrementalHasher::IncrementalHasher(
    gsl::not_null<CommitTemplate const*> const& commit)
    : commit_{commit},
      prefix_state_{MakeGitCommitHasher(commit->ContentSize())},
      middle_{commit->Middle()},
      suffix_{commit->Suffix()} {
    prefix_state_.Update(commit->Prefix());
}

auto IncrementalHasher::Try(OffsetPair const& offsets) const noexcept
    -> std::optional<Hasher::HashDigest> {
    auto const author = commit_->AuthorTime().Shift(offsets.delta_author);
    auto const committer =
        commit_->CommitterTime().Shift(offsets.delta_committer);
    if (not author or not committer) {
        return std::nullopt;
    }

    auto hasher = prefix_state_;
    fmt::format_int const author_digits{*author};
    hasher.Update({author_digits.data(), author_digits.size()});
    hasher.Update(middle_);
    fmt::format_int const committer_digits{*committer};
    hasher.Update({committer_digits.data(), committer_digits.size()});
    hasher.Update(suffix_);
    return std::move(hasher).Finalize();
}
