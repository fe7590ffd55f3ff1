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

#ifndef INCLUDED_SRC_VAINHASH_CRYPTO_HASHER_HPP
#define INCLUDED_SRC_VAINHASH_CRYPTO_HASHER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "openssl/sha.h"
#include "src/utils/cpp/hex_string.hpp"

/// \brief Incremental SHA-1 hasher, the hash git uses to identify objects.
/// The complete hash state is held by value, so copying a hasher forks the
/// computation: the copy continues from the same state without rehashing the
/// data fed so far.
class Hasher final {
  public:
    static constexpr std::size_t kDigestLength = SHA_DIGEST_LENGTH;

    /// \brief Raw 20-byte SHA-1 digest.
    class HashDigest final {
        friend Hasher;

      public:
        using Bytes = std::array<std::uint8_t, kDigestLength>;

        /// \brief Digest from raw bytes, std::nullopt on length mismatch.
        [[nodiscard]] static auto FromRaw(std::string_view raw) noexcept
            -> std::optional<HashDigest>;

        /// \brief Digest from 40 hex characters.
        [[nodiscard]] static auto FromHex(std::string_view hex) noexcept
            -> std::optional<HashDigest>;

        [[nodiscard]] auto Raw() const& noexcept -> Bytes const& {
            return bytes_;
        }

        [[nodiscard]] auto HexString() const -> std::string {
            return ToHexString(bytes_);
        }

        [[nodiscard]] auto operator==(HashDigest const& other) const noexcept
            -> bool = default;

      private:
        Bytes bytes_{};

        explicit HashDigest(Bytes const& bytes) noexcept : bytes_{bytes} {}
    };

    /// \brief Create a hasher in its initial state.
    Hasher() noexcept;

    Hasher(Hasher const& other) noexcept = default;
    Hasher(Hasher&& other) noexcept = default;
    auto operator=(Hasher const& other) noexcept -> Hasher& = default;
    auto operator=(Hasher&& other) noexcept -> Hasher& = default;
    ~Hasher() noexcept = default;

    /// \brief Feed data to the hasher.
    void Update(std::string_view data) noexcept;

    /// \brief Finalize hash. The hasher must not be used afterwards.
    [[nodiscard]] auto Finalize() && noexcept -> HashDigest;

  private:
    SHA_CTX ctx_{};

    [[noreturn]] static void FatalError(char const* operation) noexcept;
};

#endif  // INCLUDED_SRC_VAINHASH_CRYPTO_HASHER_HPP
