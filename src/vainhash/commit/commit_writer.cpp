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

#include "src/vainhash/commit/commit_writer.hpp"

#include <string>
#include <utility>

#include "fmt/core.h"
#include "src/vainhash/logging/log_level.hpp"
#include "src/vainhash/logging/logger.hpp"

auto CommitWriter::Write(CommitTemplate const& commit,
                         OffsetPair const& offsets,
                         Hasher::HashDigest const& expected_id,
                         Hasher::HashDigest const& original_id) const
    -> expected<Outcome, VainError> {
    auto content = commit.Render(offsets);
    if (not content) {
        return MakeVainError(
            VainError::Kind::VerificationMismatch,
            fmt::format("offsets ({}, {}) change the width of a timestamp",
                        offsets.delta_author,
                        offsets.delta_committer));
    }

    auto verified = store_->VerifyHash(*content);
    if (not verified) {
        return unexpected{std::move(verified).error()};
    }
    if (not(*verified == expected_id)) {
        return MakeVainError(
            VainError::Kind::VerificationMismatch,
            fmt::format("computed {}, but git computed {}",
                        expected_id.HexString(),
                        verified->HexString()));
    }
    Logger::Log(LogLevel::Debug,
                "Store confirmed commit id {}",
                verified->HexString());

    if (dry_run_) {
        return Outcome{.id = *verified, .replaced = false};
    }

    auto replaced = store_->ReplaceCurrent(*content, expected_id, original_id);
    if (not replaced) {
        return unexpected{std::move(replaced).error()};
    }
    Logger::Log(LogLevel::Info,
                "Replaced commit {} by {}",
                original_id.HexString(),
                replaced->HexString());
    return Outcome{.id = *replaced, .replaced = true};
}
