#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "path_set.hpp"
#include "../../infra/error_handler/error.hpp"

namespace rcopy::core {

inline constexpr char kErrorRecordDelimiter = '|';

struct ErrorRecord {
    std::string path;
    std::string message;

    /// "<path>|<message>" без перевода строки; переводы строк в message заменяются пробелами.
    [[nodiscard]] auto to_line() const -> std::string;

    /// Первое поле до '|' = путь; строки с пустым путём отбрасываются.
    [[nodiscard]] static auto parse(std::string_view line) -> std::optional<ErrorRecord>;

    friend bool operator==(const ErrorRecord&, const ErrorRecord&) = default;
};

/// Журнал файлов, которые не удалось скопировать при последней попытке.
class ErrorLedger {
public:
    explicit ErrorLedger(std::filesystem::path path);

    [[nodiscard]] auto load_records() const -> infra::Result<std::vector<ErrorRecord>>;

    /// Пути из журнала в порядке записей. Пустой список, если файла нет.
    [[nodiscard]] auto load_failed_paths() const -> infra::Result<std::vector<std::string>>;

    /// Заменяет содержимое файла ровно на records.
    [[nodiscard]] auto overwrite(const std::vector<ErrorRecord>& records) const -> infra::VoidResult;

    /// Дописывает records в конец, не трогая старые записи. Пустой records ничего не создаёт.
    [[nodiscard]] auto append(const std::vector<ErrorRecord>& records) const -> infra::VoidResult;

    /// Старые записи, чьи пути не входили в attempted, затем failures.
    /// Если файла не было и писать нечего, файл не создаётся.
    [[nodiscard]] auto supersede(const PathSet& attempted,
                                 const std::vector<ErrorRecord>& failures) const -> infra::VoidResult;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace rcopy::core
