#include "session.hpp"
#include "../discovery/discovery.hpp"
#include "../ledger/error_ledger.hpp"
#include "../ledger/path_set.hpp"
#include "../ledger/progress_ledger.hpp"
#include <system_error>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>
#include <fmt/core.h>

namespace rcopy::core {

namespace {

struct Workspace {
    std::filesystem::path source_root;
    std::filesystem::path destination_root;
    ProgressLedger progress;
    ErrorLedger errors;
};

// Предусловия сессии: до их проверки на диске ничего не создаётся
auto prepare(const SessionRequest& request, const infra::Config& config) -> infra::Result<Workspace> {
    std::error_code ec;
    if (!std::filesystem::is_directory(request.source, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Source directory does not exist: {}", request.source.string())));
    }

    auto source_root = std::filesystem::absolute(request.source, ec).lexically_normal();
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Cannot resolve {}: {}", request.source.string(), ec.message())));
    }
    auto destination_root = std::filesystem::absolute(request.destination, ec).lexically_normal();
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Cannot resolve {}: {}", request.destination.string(), ec.message())));
    }

    // Копирование каталога в самого себя обнулило бы исходные файлы
    if (std::filesystem::exists(destination_root, ec) &&
        std::filesystem::equivalent(source_root, destination_root, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Source and destination are the same directory: {}", source_root.string())));
    }

    std::filesystem::create_directories(destination_root, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Cannot create destination {}: {}", destination_root.string(), ec.message())));
    }

    auto progress_path = destination_root / config.progress_log_name;
    auto error_path = destination_root / config.error_log_name;

    spdlog::info("Destination: {}", destination_root.string());
    spdlog::info("Progress Log: {}", progress_path.string());
    spdlog::info("Error Log:    {}", error_path.string());

    return Workspace{
        .source_root = std::move(source_root),
        .destination_root = std::move(destination_root),
        .progress = ProgressLedger(std::move(progress_path), config.fsync_progress, config.case_sensitive_ledger),
        .errors = ErrorLedger(std::move(error_path)),
    };
}

auto make_report(SessionMode mode, const Workspace& ws) -> SessionReport {
    SessionReport report;
    report.mode = mode;
    report.destination = ws.destination_root;
    report.progress_log = ws.progress.path();
    report.error_log = ws.errors.path();
    return report;
}

auto attempted_set(const SessionOutcome& outcome, bool case_sensitive) -> PathSet {
    PathSet attempted(case_sensitive);
    for (const auto& path : outcome.attempted) {
        attempted.insert(path.string());
    }
    return attempted;
}

void fill_from_outcome(SessionReport& report, const SessionOutcome& outcome, std::size_t worklist_size) {
    report.attempted = outcome.attempted.size();
    report.copied = outcome.copied;
    report.failed = outcome.failures.size();
    report.interrupted = outcome.interrupted;
    report.not_attempted = worklist_size - outcome.attempted.size();
}

auto run_copy(Workspace& ws, const infra::Config& config, const extensions::VerifiedCopier& copier,
              ProgressCallback on_progress, StopPredicate stop_requested)
    -> infra::Result<SessionReport>
{
    spdlog::info("Mode: Normal Copy");
    auto report = make_report(SessionMode::Copy, ws);

    // 1. Что уже скопировано в прошлых запусках
    auto done = ws.progress.load();
    if (!done) {
        return std::unexpected(infra::log_and_return(std::move(done.error())));
    }
    if (!done->empty()) {
        spdlog::info("Found {} files that were already copied. Resuming...", done->size());
    }

    // 2. Обход источника и фильтрация по журналу прогресса
    spdlog::info("Discovering files in source directory...");
    auto all_files = discover_files(ws.source_root, DiscoveryOptions{
        .follow_symlinks = config.follow_symlinks,
        .exclude_patterns = config.exclude_patterns,
        .include_patterns = config.include_patterns,
    });
    if (!all_files) {
        return std::unexpected(infra::log_and_return(std::move(all_files.error())));
    }

    std::vector<std::filesystem::path> worklist;
    worklist.reserve(all_files->size());
    std::size_t ledger_files = 0;
    for (auto& file : *all_files) {
        // назначение внутри источника: свои журналы не копируем
        if (file == ws.progress.path() || file == ws.errors.path()) {
            ++ledger_files;
            continue;
        }
        if (!done->contains(file.string())) {
            worklist.push_back(std::move(file));
        }
    }

    report.discovered = all_files->size() - ledger_files;
    report.skipped = report.discovered - worklist.size();
    spdlog::info("Found {} total files. {} files need to be copied.", report.discovered, worklist.size());
    if (worklist.empty()) {
        report.nothing_to_do = true;
    }

    // 3. Сессия
    CopySessionEngine engine(SessionContext{
        .source_root = ws.source_root,
        .destination_root = ws.destination_root,
        .progress = ws.progress,
        .on_progress = std::move(on_progress),
        .stop_requested = std::move(stop_requested),
    }, copier);
    auto outcome = engine.run(worklist);
    fill_from_outcome(report, outcome, worklist.size());

    // 4. Журнал ошибок пишется только в конце сессии
    infra::VoidResult written;
    if (config.error_log_policy == infra::ErrorLogPolicy::Append) {
        written = ws.errors.append(outcome.failures);
    } else {
        written = ws.errors.supersede(attempted_set(outcome, config.case_sensitive_ledger), outcome.failures);
    }
    if (!written) {
        return std::unexpected(infra::log_and_return(std::move(written.error())));
    }

    return report;
}

auto run_retry(Workspace& ws, const infra::Config& config, const extensions::VerifiedCopier& copier,
               ProgressCallback on_progress, StopPredicate stop_requested)
    -> infra::Result<SessionReport>
{
    spdlog::info("Mode: Retry Failed Files");
    auto report = make_report(SessionMode::Retry, ws);

    // 1. Что упало в прошлый раз
    auto failed = ws.errors.load_failed_paths();
    if (!failed) {
        return std::unexpected(infra::log_and_return(std::move(failed.error())));
    }

    PathSet seen(config.case_sensitive_ledger);
    std::vector<std::filesystem::path> worklist;
    worklist.reserve(failed->size());
    for (auto& path : *failed) {
        if (seen.insert(path)) {
            worklist.emplace_back(std::move(path));
        }
    }

    if (worklist.empty()) {
        spdlog::info("No failed files found in the error log. Nothing to retry.");
        report.nothing_to_do = true;
        return report;
    }
    spdlog::info("Found {} files to retry.", worklist.size());

    // 2. Сессия по списку ошибок
    CopySessionEngine engine(SessionContext{
        .source_root = ws.source_root,
        .destination_root = ws.destination_root,
        .progress = ws.progress,
        .on_progress = std::move(on_progress),
        .stop_requested = std::move(stop_requested),
    }, copier);
    auto outcome = engine.run(worklist);
    fill_from_outcome(report, outcome, worklist.size());

    // 3. Успешные повторы уходят из журнала ошибок; непройденные (прерывание) остаются
    if (auto written = ws.errors.supersede(attempted_set(outcome, config.case_sensitive_ledger), outcome.failures);
        !written) {
        return std::unexpected(infra::log_and_return(std::move(written.error())));
    }

    return report;
}

} // namespace

auto run_session(const SessionRequest& request,
                 const infra::Config& config,
                 const extensions::VerifiedCopier& copier,
                 ProgressCallback on_progress,
                 StopPredicate stop_requested)
    -> infra::Result<SessionReport>
{
    auto ws = prepare(request, config);
    if (!ws) {
        return std::unexpected(infra::log_and_return(std::move(ws.error())));
    }

    switch (request.mode) {
        case SessionMode::Retry:
            return run_retry(*ws, config, copier, std::move(on_progress), std::move(stop_requested));
        case SessionMode::Copy:
        default:
            return run_copy(*ws, config, copier, std::move(on_progress), std::move(stop_requested));
    }
}

} // namespace rcopy::core
