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

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "CLI/CLI.hpp"
#include "fmt/core.h"
#include "gsl/gsl"
#include "src/vainhash/commit/commit_template.hpp"
#include "src/vainhash/commit/commit_writer.hpp"
#include "src/vainhash/common/vain_error.hpp"
#include "src/vainhash/git/git_commit_store.hpp"
#include "src/vainhash/logging/log_config.hpp"
#include "src/vainhash/logging/log_level.hpp"
#include "src/vainhash/logging/log_sink_cmdline.hpp"
#include "src/vainhash/logging/log_sink_file.hpp"
#include "src/vainhash/logging/logger.hpp"
#include "src/vainhash/main/cli.hpp"
#include "src/vainhash/main/exit_codes.hpp"
#include "src/vainhash/main/result_dump.hpp"
#include "src/vainhash/search/search_coordinator.hpp"
#include "src/vainhash/search/target_pattern.hpp"
#include "src/vainhash/system/cpu.hpp"

namespace {

constexpr auto kBuiltinDefaultPattern = "1234";

[[nodiscard]] auto ParseCommandLineArguments(int argc, char const* const* argv)
    -> CommandLineArguments {
    CLI::App app(
        "git-vain, rewrites the current commit's timestamps until its id "
        "starts with a chosen hex pattern");
    app.option_defaults()->take_last();

    CommandLineArguments clargs;
    SetupSearchArguments(&app, &clargs.search);
    SetupLogArguments(&app, &clargs.log);

    try {
        app.parse(argc, argv);
    } catch (CLI::Error& e) {
        [[maybe_unused]] auto err = app.exit(e);
        std::exit(e.get_exit_code() == 0 ? kExitSuccess : kExitClargsError);
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Error, "Command line parse error: {}", ex.what());
        std::exit(kExitClargsError);
    }
    return clargs;
}

void SetupDefaultLogging() {
    LogConfig::SetLogLimit(kDefaultLogLevel);
    LogConfig::SetSinks({LogSinkCmdLine::CreateFactory()});
}

void SetupLogging(LogArguments const& clargs) {
    if (clargs.log_limit) {
        LogConfig::SetLogLimit(*clargs.log_limit);
    }
    else {
        LogConfig::SetLogLimit(kDefaultLogLevel);
    }
    LogConfig::SetSinks({LogSinkCmdLine::CreateFactory(not clargs.plain_log)});
    for (auto const& log_file : clargs.log_files) {
        LogConfig::AddSink(LogSinkFile::CreateFactory(
            log_file,
            clargs.log_append ? LogSinkFile::Mode::Append
                              : LogSinkFile::Mode::Overwrite));
    }
}

/// \brief Log the error and return the matching exit code.
[[nodiscard]] auto Fail(VainError const& error) -> int {
    Logger::Log(LogLevel::Error,
                "{}: {}",
                VainError::KindToString(error.GetKind()),
                error.Message());
    return ExitCodeFor(error.GetKind());
}

/// \brief Pattern given on the command line, configured in the repository,
/// or the built-in default, in this order.
[[nodiscard]] auto SelectPattern(SearchArguments const& clargs,
                                 gsl::not_null<ICommitStore*> const& store)
    -> expected<TargetPattern, VainError> {
    if (clargs.pattern) {
        return TargetPattern::Create(*clargs.pattern);
    }
    auto configured = store->ReadDefaultPattern();
    if (not configured) {
        return unexpected{std::move(configured).error()};
    }
    if (*configured) {
        Logger::Log(LogLevel::Debug,
                    "Using pattern {} from git config {}",
                    **configured,
                    GitCommitStore::kDefaultPatternKey);
        return TargetPattern::Create(**configured);
    }
    return TargetPattern::Create(kBuiltinDefaultPattern);
}

[[nodiscard]] auto Run(SearchArguments const& clargs) -> int {
    auto store = GitCommitStore::Open(clargs.repository);
    if (not store) {
        return Fail(store.error());
    }
    gsl::not_null<ICommitStore*> const store_ptr{store->get()};

    auto pattern = SelectPattern(clargs, store_ptr);
    if (not pattern) {
        return Fail(pattern.error());
    }

    auto current = store_ptr->ReadCurrent();
    if (not current) {
        return Fail(current.error());
    }
    auto commit = CommitTemplate::Parse(current->content);
    if (not commit) {
        return Fail(commit.error());
    }

    auto const jobs = clargs.jobs ? *clargs.jobs : Cpu::PerformanceCores();
    SearchCoordinator const coordinator{
        &*commit,
        &*pattern,
        SearchOptions{
            .bound = clargs.bound, .jobs = jobs, .report_progress = true}};
    auto outcome = coordinator.Run();

    SearchReport report{.pattern = pattern->ToString(),
                        .original_id = current->id.HexString(),
                        .result = outcome.result,
                        .statistics = outcome.statistics,
                        .dry_run = clargs.dry_run};

    auto finish = [&clargs, &report](int exit_code) -> int {
        if (clargs.dump_result and
            not DumpSearchReport(report, *clargs.dump_result) and
            exit_code == kExitSuccess) {
            return kExitUnexpectedError;
        }
        return exit_code;
    };

    if (not outcome.result) {
        Logger::Log(LogLevel::Warning,
                    "No commit id starting with {} within {} seconds of the "
                    "original timestamps ({} candidates hashed)",
                    pattern->ToString(),
                    clargs.bound,
                    outcome.statistics.tried);
        return finish(kExitNotFound);
    }

    auto const& result = *outcome.result;
    Logger::Log(LogLevel::Info,
                "Found {} at index {} after {:.2f}s",
                result.digest.HexString(),
                result.index,
                outcome.statistics.elapsed.count());

    CommitWriter const writer{store_ptr, clargs.dry_run};
    auto written =
        writer.Write(*commit, result.offsets, result.digest, current->id);
    if (not written) {
        return finish(Fail(written.error()));
    }
    report.replaced = written->replaced;

    std::cout << fmt::format("∆a: {}, ∆c: {}",
                             result.offsets.delta_author,
                             result.offsets.delta_committer)
              << std::endl;
    std::cout << written->id.HexString() << std::endl;
    if (clargs.dry_run) {
        Logger::Log(LogLevel::Info, "Dry run, repository left unchanged");
    }
    return finish(kExitSuccess);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
    SetupDefaultLogging();
    try {
        auto arguments = ParseCommandLineArguments(argc, argv);
        SetupLogging(arguments.log);
        return Run(arguments.search);
    } catch (std::exception const& ex) {
        Logger::Log(
            LogLevel::Error, "Caught exception with message: {}", ex.what());
    }
    return kExitUnexpectedError;
}
