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

#include "src/vainhash/crypto/hasher.hpp"

#include <algorithm>
#include <exception>

#include "src/vainhash/logging/log_level.hpp"
#include "src/vainhash/logging/logger.hpp"

namespace {
inline constexpr int kOpenSslTrue = 1;
}  // namespace

auto Hasher::HashDigest::FromRaw(std::string_view raw) noexcept
    -> std::optional<HashDigest> {
    if (raw.size() != kDigestLength) {
        return std::nullopt;
    }
    Bytes bytes{};
    std::transform(raw.begin(), raw.end(), bytes.begin(), [](char c) {
        return static_cast<std::uint8_t>(c);
    });
    return HashDigest{bytes};
}

auto Hasher::HashDigest::FromHex(std::string_view hex) noexcept
    -> std::optional<HashDigest> {
    if (hex.size() != 2 * kDigestLength) {
        return std::nullopt;
    }
    try {
        if (auto raw = FromHexString(hex)) {
            return FromRaw(*raw);
        }
    } catch (std::exception const& e) {
        Logger::Log(
            LogLevel::Debug, "parsing digest {} failed: {}", hex, e.what());
    }
    return std::nullopt;
}

Hasher::Hasher() noexcept {
    if (SHA1_Init(&ctx_) != kOpenSslTrue) {
        FatalError("Initialize");
    }
}

void Hasher::Update(std::string_view data) noexcept {
    if (SHA1_Update(&ctx_, data.data(), data.size()) != kOpenSslTrue) {
        FatalError("Update");
    }
}

auto Hasher::Finalize() && noexcept -> HashDigest {
    HashDigest::Bytes out{};
    if (SHA1_Final(out.data(), &ctx_) != kOpenSslTrue) {
        FatalError("Finalize");
    }
    return HashDigest{out};
}

void Hasher::FatalError(char const* operation) noexcept {
    Logger::Log(LogLevel::Error, "Hasher::{} failed.", operation);
    std::terminate();
}
