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

#ifndef INCLUDED_SRC_VAINHASH_COMMON_VAIN_ERROR_HPP
#define INCLUDED_SRC_VAINHASH_COMMON_VAIN_ERROR_HPP

#include <cstdint>
#include <string>
#include <utility>

#include "src/utils/cpp/expected.hpp"

/// \brief Fatal conditions of a vanity search run. Exhaustion of the search
/// space is not an error and therefore has no kind here.
class VainError final {
  public:
    enum class Kind : std::uint8_t {
        InvalidPattern,         ///< Pattern empty, too long or not hex
        MissingTimestampField,  ///< Commit lacks author or committer line
        MalformedTimestamp,     ///< Marker present, but no usable timestamp
        VerificationMismatch,   ///< Git disagrees with the computed digest
        StoreFailure            ///< Repository access failed
    };

    VainError(Kind kind, std::string message) noexcept
        : kind_{kind}, message_{std::move(message)} {}

    [[nodiscard]] auto GetKind() const noexcept -> Kind { return kind_; }

    [[nodiscard]] auto Message() const& noexcept -> std::string const& {
        return message_;
    }

    [[nodiscard]] static auto KindToString(Kind kind) noexcept -> char const* {
        switch (kind) {
            case Kind::InvalidPattern:
                return "invalid pattern";
            case Kind::MissingTimestampField:
                return "missing timestamp field";
            case Kind::MalformedTimestamp:
                return "malformed timestamp";
            case Kind::VerificationMismatch:
                return "verification mismatch";
            case Kind::StoreFailure:
                return "store failure";
        }
        return "unknown error";
    }

  private:
    Kind kind_;
    std::string message_;
};

/// \brief Shorthand for creating the error alternative of an expected.
[[nodiscard]] inline auto MakeVainError(VainError::Kind kind,
                                        std::string message) noexcept
    -> unexpected<VainError> {
    return unexpected{VainError{kind, std::move(message)}};
}

#endif  // INCLUDED_SRC_VAINHASH_COMMON_VAIN_ERROR_HPP
