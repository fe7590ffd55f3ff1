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

#ifndef INCLUDED_SRC_VAINHASH_MAIN_EXIT_CODES_HPP
#define INCLUDED_SRC_VAINHASH_MAIN_EXIT_CODES_HPP

#include "src/vainhash/common/vain_error.hpp"

enum VainExitCodes {
    kExitSuccess = 0,
    kExitNotFound = 1,                // no match within the search bound
    kExitClargsError = 64,            // error in parsing clargs
    kExitInvalidPattern = 65,         // pattern empty, too long or not hex
    kExitParseError = 66,             // commit without usable timestamps
    kExitStoreError = 67,             // repository access failed
    kExitVerificationMismatch = 68,   // git computed a different commit id
    kExitUnexpectedError = 69         // none of the known errors
};

[[nodiscard]] static inline auto ExitCodeFor(VainError::Kind kind) noexcept
    -> VainExitCodes {
    switch (kind) {
        case VainError::Kind::InvalidPattern:
            return kExitInvalidPattern;
        case VainError::Kind::MissingTimestampField:
        case VainError::Kind::MalformedTimestamp:
            return kExitParseError;
        case VainError::Kind::StoreFailure:
            return kExitStoreError;
        case VainError::Kind::VerificationMismatch:
            return kExitVerificationMismatch;
    }
    return kExitUnexpectedError;
}

#endif  // INCLUDED_SRC_VAINHASH_MAIN_EXIT_CODES_HPP
