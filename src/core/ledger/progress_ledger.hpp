#pragma once

#include <filesystem>
#include "path_set.hpp"
#include "../../infra/error_handler/error.hpp"

namespace rcopy::core {

/// Журнал успешно скопированных файлов: одна строка = абсолютный путь источника.
/// Только дописывается; дубликаты допустимы, при чтении схлопываются в PathSet.
class ProgressLedger {
public:
    explicit ProgressLedger(std::filesystem::path path,
                            bool sync = true,
                            bool case_sensitive = false);

    /// Пустое множество, если файла нет.
    [[nodiscard]] auto load() const -> infra::Result<PathSet>;

    /// Дописывает file в журнал. При sync запись переживает падение процесса
    /// сразу после возврата. Вызывать только после успешной верификации.
    [[nodiscard]] auto record_success(const std::filesystem::path& file) const -> infra::VoidResult;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
    bool sync_;
    bool case_sensitive_;
};

} // namespace rcopy::core
