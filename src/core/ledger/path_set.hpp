#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>

namespace rcopy::core {

/// Множество путей журнала. По умолчанию сравнение без учёта регистра (ASCII).
class PathSet {
public:
    explicit PathSet(bool case_sensitive = false);

    /// Возвращает false, если такой путь уже был.
    bool insert(std::string_view path);
    [[nodiscard]] auto contains(std::string_view path) const -> bool;

    [[nodiscard]] auto size() const -> std::size_t { return keys_.size(); }
    [[nodiscard]] auto empty() const -> bool { return keys_.empty(); }
    [[nodiscard]] auto case_sensitive() const -> bool { return case_sensitive_; }

private:
    [[nodiscard]] auto key(std::string_view path) const -> std::string;

    bool case_sensitive_;
    std::unordered_set<std::string> keys_;
};

} // namespace rcopy::core
