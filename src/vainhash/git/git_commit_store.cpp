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

#include "src/vainhash/git/git_commit_store.hpp"

#include <exception>
#include <utility>

#include "fmt/core.h"
#include "src/vainhash/git/git_utils.hpp"
#include "src/vainhash/logging/log_level.hpp"
#include "src/vainhash/logging/logger.hpp"

extern "C" {
#include <git2.h>
}

namespace {
constexpr auto kReflogMessage = "vain: shift commit timestamps";

[[nodiscard]] auto StoreError(std::string message) -> unexpected<VainError> {
    return MakeVainError(VainError::Kind::StoreFailure, std::move(message));
}
}  // namespace

GitCommitStore::GitCommitStore(std::shared_ptr<git_repository> repo,
                               std::shared_ptr<git_odb> odb,
                               std::filesystem::path path) noexcept
    : repo_{std::move(repo)}, odb_{std::move(odb)}, path_{std::move(path)} {}

auto GitCommitStore::Open(std::filesystem::path const& path) noexcept
    -> expected<std::unique_ptr<GitCommitStore>, VainError> {
    try {
        if (not EnsureLibGit2Initialized()) {
            return StoreError("libgit2 is not available");
        }

        git_repository* repo_ptr{nullptr};
        if (git_repository_open_ext(
                &repo_ptr, path.c_str(), 0, nullptr) != 0) {
            return StoreError(
                fmt::format("opening git repository {} failed with:\n{}",
                            path.string(),
                            GitLastError()));
        }
        auto repo = std::shared_ptr<git_repository>{repo_ptr,
                                                    repository_closer};

        git_odb* odb_ptr{nullptr};
        if (git_repository_odb(&odb_ptr, repo.get()) != 0) {
            return StoreError(
                fmt::format("retrieving object database of {} failed "
                            "with:\n{}",
                            path.string(),
                            GitLastError()));
        }
        auto odb = std::shared_ptr<git_odb>{odb_ptr, odb_closer};

        auto const* git_dir = git_repository_path(repo.get());
        Logger::Log(LogLevel::Debug, "Opened git repository {}", git_dir);
        return std::unique_ptr<GitCommitStore>{new GitCommitStore(
            std::move(repo), std::move(odb), std::filesystem::path{git_dir})};
    } catch (std::exception const& ex) {
        return StoreError(
            fmt::format("opening git repository {} failed with:\n{}",
                        path.string(),
                        ex.what()));
    }
}

auto GitCommitStore::ReadCurrent() -> expected<StoredCommit, VainError> {
    git_oid head_oid;
    if (git_reference_name_to_id(&head_oid, repo_.get(), "HEAD") != 0) {
        return StoreError(
            fmt::format("retrieving head commit in git repository {} "
                        "failed with:\n{}",
                        path_.string(),
                        GitLastError()));
    }

    git_odb_object* obj_ptr{nullptr};
    if (git_odb_read(&obj_ptr, odb_.get(), &head_oid) != 0) {
        return StoreError(fmt::format("reading commit {} failed with:\n{}",
                                      git_oid_tostr_s(&head_oid),
                                      GitLastError()));
    }
    auto obj = std::unique_ptr<git_odb_object, decltype(&odb_object_closer)>{
        obj_ptr, odb_object_closer};

    if (git_odb_object_type(obj.get()) != GIT_OBJECT_COMMIT) {
        return StoreError(fmt::format("HEAD {} is not a commit",
                                      git_oid_tostr_s(&head_oid)));
    }
    auto id = DigestFromGitObjectID(head_oid);
    if (not id) {
        return StoreError("HEAD has an unsupported object id");
    }
    return StoredCommit{
        .content = std::string{static_cast<char const*>(
                                   git_odb_object_data(obj.get())),
                               git_odb_object_size(obj.get())},
        .id = *id};
}

auto GitCommitStore::VerifyHash(std::string const& content)
    -> expected<Hasher::HashDigest, VainError> {
    git_oid oid;
    if (git_odb_hash(
            &oid, content.data(), content.size(), GIT_OBJECT_COMMIT) != 0) {
        return StoreError(
            fmt::format("hashing commit failed with:\n{}", GitLastError()));
    }
    auto id = DigestFromGitObjectID(oid);
    if (not id) {
        return StoreError("git computed an unsupported object id");
    }
    return *id;
}

auto GitCommitStore::ReplaceCurrent(std::string const& content,
                                    Hasher::HashDigest const& expected_id,
                                    Hasher::HashDigest const& replaced_id)
    -> expected<Hasher::HashDigest, VainError> {
    auto old_oid = GitObjectID(replaced_id);
    if (not old_oid) {
        return StoreError(
            fmt::format("invalid commit id {}", replaced_id.HexString()));
    }

    git_oid new_oid;
    if (git_odb_write(&new_oid,
                      odb_.get(),
                      content.data(),
                      content.size(),
                      GIT_OBJECT_COMMIT) != 0) {
        return StoreError(
            fmt::format("writing commit failed with:\n{}", GitLastError()));
    }
    auto written = DigestFromGitObjectID(new_oid);
    if (not written or not(*written == expected_id)) {
        return StoreError(fmt::format("written commit has id {}, expected {}",
                                      git_oid_tostr_s(&new_oid),
                                      expected_id.HexString()));
    }

    auto target = HeadTarget();
    if (not target) {
        return unexpected{std::move(target).error()};
    }

    git_reference* ref_ptr{nullptr};
    auto const err = git_reference_create_matching(&ref_ptr,
                                                   repo_.get(),
                                                   target->c_str(),
                                                   &new_oid,
                                                   /*force=*/1,
                                                   &*old_oid,
                                                   kReflogMessage);
    if (err != 0) {
        return StoreError(fmt::format(
            "moving {} from {} to {} failed with:\n{}",
            *target,
            replaced_id.HexString(),
            expected_id.HexString(),
            err == GIT_EMODIFIED ? "reference was modified concurrently"
                                 : GitLastError()));
    }
    reference_closer(ref_ptr);
    Logger::Log(LogLevel::Debug,
                "Moved {} to {}",
                *target,
                expected_id.HexString());
    return *written;
}

auto GitCommitStore::ReadDefaultPattern()
    -> expected<std::optional<std::string>, VainError> {
    git_config* cfg_ptr{nullptr};
    if (git_repository_config_snapshot(&cfg_ptr, repo_.get()) != 0) {
        return StoreError(fmt::format(
            "retrieving config object failed with:\n{}", GitLastError()));
    }
    auto cfg = std::unique_ptr<git_config, decltype(&config_closer)>{
        cfg_ptr, config_closer};

    char const* value{nullptr};
    auto const err =
        git_config_get_string(&value, cfg.get(), kDefaultPatternKey);
    if (err == GIT_ENOTFOUND) {
        return std::optional<std::string>{};
    }
    if (err != 0) {
        return StoreError(fmt::format("reading {} failed with:\n{}",
                                      kDefaultPatternKey,
                                      GitLastError()));
    }
    return std::optional<std::string>{value};
}

auto GitCommitStore::HeadTarget() const -> expected<std::string, VainError> {
    git_reference* head_ptr{nullptr};
    if (git_reference_lookup(&head_ptr, repo_.get(), "HEAD") != 0) {
        return StoreError(
            fmt::format("looking up HEAD failed with:\n{}", GitLastError()));
    }
    auto head = std::unique_ptr<git_reference, decltype(&reference_closer)>{
        head_ptr, reference_closer};
    if (git_reference_type(head.get()) == GIT_REFERENCE_SYMBOLIC) {
        return std::string{git_reference_symbolic_target(head.get())};
    }
    return std::string{"HEAD"};
}
