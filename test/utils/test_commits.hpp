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

#ifndef INCLUDED_TEST_UTILS_TEST_COMMITS_HPP
#define INCLUDED_TEST_UTILS_TEST_COMMITS_HPP

#include <string>

// Raw commit objects and their ids, as computed by git hash-object.
namespace TestCommits {

inline std::string const kSample =
    "tree 4b825dc642cb6eb9a060e54bf8d69288fbee4904\n"
    "parent 26f67e5988b15877d2807511b262c870b2492548\n"
    "author Jane Doe <jane@example.org> 1721827347 +0200\n"
    "committer Jane Doe <jane@example.org> 1721827399 +0200\n"
    "\n"
    "Add vanity search\n";
inline std::string const kSampleId =
    "621086fa10703021e8c2639d88c925f8d0c35f91";

inline constexpr long long kSampleAuthorTime = 1721827347;
inline constexpr long long kSampleCommitterTime = 1721827399;

// kSample with author time +1 (spiral index 1)
inline std::string const kSampleAuthorPlusOneId =
    "6a9ae14d1798f75ed5030f712b31f6da964b17b6";
// kSample with committer time -1 (spiral index 7)
inline std::string const kSampleCommitterMinusOneId =
    "99a4a82c25e4f8ab130a5a37835b1f59c8c067b9";

// kSample at spiral index 1777, offsets (-21, 8). Within bound 30, no other
// index yields an id starting with "436e".
inline constexpr long long kUniqueIndex = 1777;
inline constexpr long long kUniqueDeltaAuthor = -21;
inline constexpr long long kUniqueDeltaCommitter = 8;
inline constexpr long long kUniqueBound = 30;
inline std::string const kUniquePattern = "436e11";
inline std::string const kUniqueId =
    "436e11b588386b8f574223ba85809b4c2adcdd38";

}  // namespace TestCommits

#endif  // INCLUDED_TEST_UTILS_TEST_COMMITS_HPP
