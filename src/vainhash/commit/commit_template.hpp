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

#ifndef INCLUDED_SRC_VAINHASH_COMMIT_COMMIT_TEMPLATE_HPP
#define INCLUDED_SRC_VAINHASH_COMMIT_COMMIT_TEMPLATE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "src/utils/cpp/expected.hpp"
#include "src/vainhash/common/vain_error.hpp"
#include "src/vainhash/commit/timestamp.hpp"

/// \brief Immutable view of a serialized commit, split around its author and
/// committer timestamps:
///   <prefix><author time><middle><committer time><suffix>
/// The prefix ends right after the author's "> ", the suffix starts right
/// after the committer's digits and includes the message.
class CommitTemplate final {
  public:
    /// \brief Split raw commit content (without the git object header).
    /// Only the header, up to the first empty line, is searched for the
    /// "author " and "committer " lines.
    [[nodiscard]] static auto Parse(std::string content)
        -> expected<CommitTemplate, VainError>;

    [[nodiscard]] auto Prefix() const noexcept -> std::string_view {
        return View().substr(0, author_pos_);
    }
    [[nodiscard]] auto Middle() const noexcept -> std::string_view {
        auto const begin = author_pos_ + author_time_.Width();
        return View().substr(begin, committer_pos_ - begin);
    }
    [[nodiscard]] auto Suffix() const noexcept -> std::string_view {
        return View().substr(committer_pos_ + committer_time_.Width());
    }

    [[nodiscard]] auto AuthorTime() const noexcept -> Timestamp const& {
        return author_time_;
    }
    [[nodiscard]] auto CommitterTime() const noexcept -> Timestamp const& {
        return committer_time_;
    }

    /// \brief Digit width of the author timestamp.
    [[nodiscard]] auto TimestampDigitWidth() const noexcept -> std::size_t {
        return author_time_.Width();
    }

    /// \brief Byte length of every rendering of this template.
    [[nodiscard]] auto ContentSize() const noexcept -> std::size_t {
        return content_.size();
    }

    [[nodiscard]] auto Content() const& noexcept -> std::string const& {
        return content_;
    }

    /// \brief Full commit content with both timestamps shifted. Returns
    /// std::nullopt if a shift would change a timestamp's width or make it
    /// negative. Rendering {0, 0} reproduces the parsed content.
    [[nodiscard]] auto Render(OffsetPair const& offsets) const
        -> std::optional<std::string>;

  private:
    std::string content_;
    std::size_t author_pos_;
    std::size_t committer_pos_;
    Timestamp author_time_;
    Timestamp committer_time_;

    CommitTemplate(std::string content,
                   std::size_t author_pos,
                   std::size_t committer_pos,
                   Timestamp author_time,
                   Timestamp committer_time) noexcept;

    [[nodiscard]] auto View() const noexcept -> std::string_view {
        return content_;
    }
};

#endif  // INCLUDED_SRC_VAINHASH_COMMIT_COMMIT_TEMPLATE_HPP
