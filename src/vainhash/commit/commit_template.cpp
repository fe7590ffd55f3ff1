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

#include "src/vainhash/commit/commit_template.hpp"

#include <utility>

#include "fmt/core.h"
#include "src/vainhash/logging/log_level.hpp"
#include "src/vainhash/logging/logger.hpp"

namespace {

/// \brief Location and value of one timestamp in the commit header.
struct TimestampField {
    std::size_t pos{};
    std::size_t line_end{};
    Timestamp time;
};

/// \brief Start of the first header line at or after `from` (a line start)
/// that begins with "<key> ".
[[nodiscard]] auto FindHeaderLine(std::string_view header,
                                  std::string_view key,
                                  std::size_t from) noexcept
    -> std::optional<std::size_t> {
    auto pos = from;
    while (pos < header.size()) {
        auto const line_end = header.find('\n', pos);
        auto const line = header.substr(
            pos,
            line_end == std::string_view::npos ? std::string_view::npos
                                               : line_end - pos);
        if (line.size() > key.size() and line.starts_with(key) and
            line[key.size()] == ' ') {
            return pos;
        }
        if (line_end == std::string_view::npos) {
            break;
        }
        pos = line_end + 1;
    }
    return std::nullopt;
}

[[nodiscard]] auto ParseTimestampField(std::string_view header,
                                       std::string_view key,
                                       std::size_t from)
    -> expected<TimestampField, VainError> {
    auto const line_begin = FindHeaderLine(header, key, from);
    if (not line_begin) {
        return MakeVainError(
            VainError::Kind::MissingTimestampField,
            fmt::format("commit header has no {} line", key));
    }
    auto line_end = header.find('\n', *line_begin);
    if (line_end == std::string_view::npos) {
        line_end = header.size();
    }
    auto const line = header.substr(*line_begin, line_end - *line_begin);

    // the identity ends with the email's closing bracket
    auto const bracket = line.rfind("> ");
    if (bracket == std::string_view::npos) {
        return MakeVainError(
            VainError::Kind::MalformedTimestamp,
            fmt::format("{} line has no identity: {}", key, line));
    }
    auto const digits_begin = bracket + 2;
    auto digits_end = digits_begin;
    while (digits_end < line.size() and line[digits_end] >= '0' and
           line[digits_end] <= '9') {
        ++digits_end;
    }
    auto time = Timestamp::FromDigits(
        line.substr(digits_begin, digits_end - digits_begin));
    if (not time) {
        return MakeVainError(
            VainError::Kind::MalformedTimestamp,
            fmt::format("{} line has no usable timestamp: {}", key, line));
    }
    return TimestampField{.pos = *line_begin + digits_begin,
                          .line_end = line_end,
                          .time = *time};
}

}  // namespace

CommitTemplate::CommitTemplate(std::string content,
                               std::size_t author_pos,
                               std::size_t committer_pos,
                               Timestamp author_time,
                               Timestamp committer_time) noexcept
    : content_{std::move(content)},
      author_pos_{author_pos},
      committer_pos_{committer_pos},
      author_time_{author_time},
      committer_time_{committer_time} {}

auto CommitTemplate::Parse(std::string content)
    -> expected<CommitTemplate, VainError> {
    std::string_view header{content};
    if (auto const end = header.find("\n\n");
        end != std::string_view::npos) {
        header = header.substr(0, end + 1);
    }

    auto author = ParseTimestampField(header, "author", 0);
    if (not author) {
        return unexpected{std::move(author).error()};
    }
    auto committer =
        ParseTimestampField(header, "committer", author->line_end + 1);
    if (not committer) {
        return unexpected{std::move(committer).error()};
    }

    if (FindHeaderLine(header, "gpgsig", 0)) {
        Logger::Log(LogLevel::Warning,
                    "Commit is signed, changing its timestamps invalidates "
                    "the signature.");
    }

    Logger::Log(LogLevel::Debug,
                "Parsed commit of {} bytes: author time {} at offset {}, "
                "committer time {} at offset {}",
                content.size(),
                author->time.Value(),
                author->pos,
                committer->time.Value(),
                committer->pos);

    return CommitTemplate{std::move(content),
                          author->pos,
                          committer->pos,
                          author->time,
                          committer->time};
}

auto CommitTemplate::Render(OffsetPair const& offsets) const
    -> std::optional<std::string> {
    auto author = author_time_.Render(offsets.delta_author);
    auto committer = committer_time_.Render(offsets.delta_committer);
    if (not author or not committer) {
        return std::nullopt;
    }
    std::string result{};
    result.reserve(content_.size());
    result.append(Prefix());
    result.append(*author);
    result.append(Middle());
    result.append(*committer);
    result.append(Suffix());
    return result;
}
