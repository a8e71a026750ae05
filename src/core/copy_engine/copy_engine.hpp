#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "../../infra/error_handler/error.hpp"
#include "../../extensions/verifier.hpp"
#include "../ledger/error_ledger.hpp"
#include "../ledger/progress_ledger.hpp"

namespace rcopy::core {

/// Сигнал после каждой попытки; на ход сессии не влияет.
struct ProgressEvent {
    std::size_t current = 0; // 1-based
    std::size_t total = 0;
    std::string file_name;
    bool succeeded = false;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using StopPredicate = std::function<bool()>;

/// Всё, что движку нужно знать о сессии. Глобального состояния движок не читает.
struct SessionContext {
    std::filesystem::path source_root;
    std::filesystem::path destination_root;
    const ProgressLedger& progress;
    ProgressCallback on_progress{};
    StopPredicate stop_requested{};
};

struct SessionOutcome {
    std::vector<ErrorRecord> failures;
    std::vector<std::filesystem::path> attempted;
    std::size_t copied = 0;
    bool interrupted = false;
};

/// Путь назначения: хвост source после строки source_root (без ведущих
/// разделителей), приклеенный к destination_root. InvalidPath, если source
/// не начинается с source_root.
[[nodiscard]] auto derive_destination(const std::filesystem::path& source_root,
                                      const std::filesystem::path& destination_root,
                                      const std::filesystem::path& source)
    -> infra::Result<std::filesystem::path>;

class CopySessionEngine {
public:
    CopySessionEngine(SessionContext context, const extensions::VerifiedCopier& copier);

    /// Последовательно копирует worklist. Ошибка одного файла сессию не прерывает.
    [[nodiscard]] auto run(const std::vector<std::filesystem::path>& worklist) -> SessionOutcome;

private:
    // copy -> verify -> запись в журнал прогресса, строго в этом порядке
    [[nodiscard]] auto process_file(const std::filesystem::path& source) -> infra::VoidResult;

    SessionContext context_;
    const extensions::VerifiedCopier& copier_;
};

} // namespace rcopy::core
