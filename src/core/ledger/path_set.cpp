#include "path_set.hpp"
#include <algorithm>

namespace rcopy::core {

PathSet::PathSet(bool case_sensitive)
    : case_sensitive_(case_sensitive) {}

bool PathSet::insert(std::string_view path) {
    return keys_.insert(key(path)).second;
}

auto PathSet::contains(std::string_view path) const -> bool {
    return keys_.contains(key(path));
}

auto PathSet::key(std::string_view path) const -> std::string {
    std::string k(path);
    if (!case_sensitive_) {
        std::ranges::transform(k, k.begin(), [](unsigned char c) {
            return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
        });
    }
    return k;
}

} // namespace rcopy::core
