#pragma once

#include <filesystem>
#include <functional>
#include <expected>
#include <cstdint>
#include "../infra/error_handler/error.hpp"

namespace rcopy::extensions {

/// Примитив копирования: перезаписывает dst содержимым src.
using CopyPrimitive = std::function<infra::VoidResult(const std::filesystem::path&,
                                                      const std::filesystem::path&)>;

struct SizeCheck {
    std::uintmax_t source_bytes = 0;
    std::uintmax_t destination_bytes = 0;

    [[nodiscard]] auto matches() const -> bool { return source_bytes == destination_bytes; }
};

/// Копирует один файл и подтверждает, что размеры src и dst совпали.
///
/// Ошибки: FileNotFound, если src исчез между обнаружением и копированием;
/// PermissionDenied / DiskFull / IOFailure от примитива или создания каталогов;
/// VerificationFailed, если примитив отчитался об успехе, а размеры разные.
class VerifiedCopier {
public:
    VerifiedCopier();
    explicit VerifiedCopier(CopyPrimitive primitive);

    [[nodiscard]] auto copy(const std::filesystem::path& src,
                            const std::filesystem::path& dst) const -> infra::VoidResult;

    [[nodiscard]] static auto compare_sizes(const std::filesystem::path& src,
                                            const std::filesystem::path& dst)
        -> infra::Result<SizeCheck>;

private:
    CopyPrimitive primitive_;
};

} // namespace rcopy::extensions
