#pragma once

#include <filesystem>
#include "session_report.hpp"
#include "../copy_engine/copy_engine.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../extensions/verifier.hpp"

namespace rcopy::core {

struct SessionRequest {
    SessionMode mode = SessionMode::Copy;
    std::filesystem::path source;
    std::filesystem::path destination;
};

/// Полный цикл одной команды: предусловия, формирование worklist по журналам,
/// прогон CopySessionEngine, обновление журнала ошибок, отчёт.
///
/// Copy:  worklist = discover(source) \ progress ledger;
///        журнал ошибок дополняется (политика из config.error_log_policy).
/// Retry: worklist = пути из журнала ошибок;
///        журнал ошибок заменяется оставшимися ошибками.
///
/// Ошибка возвращается только для условий уровня сессии (нет источника,
/// не создать назначение, не прочитать/записать журнал, сбой обхода);
/// до проверки предусловий журналы не трогаются.
[[nodiscard]] auto run_session(const SessionRequest& request,
                               const infra::Config& config,
                               const extensions::VerifiedCopier& copier,
                               ProgressCallback on_progress = {},
                               StopPredicate stop_requested = {})
    -> infra::Result<SessionReport>;

} // namespace rcopy::core
