#include <gtest/gtest.h>

#include "adapters/fs.hpp"
#include "extensions/verifier.hpp"
#include "test_utils.hpp"

#include <fstream>
#include <string>

using rcopy::extensions::VerifiedCopier;
using rcopy::infra::ErrorCode;
using rcopy::testing::TempDir;
using rcopy::testing::read_file;
using rcopy::testing::write_file;

namespace fs = std::filesystem;

TEST(VerifiedCopierTest, CopiesAndCreatesParentDirectories)
{
    TempDir dir;
    const auto src = dir / "src" / "a.txt";
    const auto dst = dir / "dst" / "deep" / "er" / "a.txt";
    write_file(src, "hello");

    VerifiedCopier copier;
    auto res = copier.copy(src, dst);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(read_file(dst), "hello");
}

TEST(VerifiedCopierTest, OverwritesExistingDestination)
{
    TempDir dir;
    const auto src = dir / "src" / "a.txt";
    const auto dst = dir / "dst" / "a.txt";
    write_file(src, "new");
    write_file(dst, "much older and longer content");

    VerifiedCopier copier;
    ASSERT_TRUE(copier.copy(src, dst).has_value());
    EXPECT_EQ(read_file(dst), "new");
}

TEST(VerifiedCopierTest, MissingSourceIsNotFound)
{
    TempDir dir;
    VerifiedCopier copier;

    auto res = copier.copy(dir / "gone.txt", dir / "dst" / "gone.txt");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::FileNotFound);
    EXPECT_FALSE(fs::exists(dir / "dst" / "gone.txt"));
}

TEST(VerifiedCopierTest, CopyOntoItselfFailsAndKeepsContent)
{
    TempDir dir;
    const auto src = dir / "a.txt";
    write_file(src, "hello");

    VerifiedCopier copier;
    auto res = copier.copy(src, dir / "." / "a.txt");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::IOFailure);
    EXPECT_EQ(read_file(src), "hello");
}

TEST(VerifiedCopierTest, TruncatedWriteFailsVerification)
{
    TempDir dir;
    const auto src = dir / "src" / "big.bin";
    const auto dst = dir / "dst" / "big.bin";
    write_file(src, std::string(1000, 'x'));

    // Примитив "успешно" пишет только половину
    VerifiedCopier copier([](const fs::path&, const fs::path& to) -> rcopy::infra::VoidResult {
        std::ofstream out(to, std::ios::binary | std::ios::trunc);
        out << std::string(500, 'x');
        return {};
    });

    auto res = copier.copy(src, dst);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::VerificationFailed);
    EXPECT_NE(res.error().message.find("500"), std::string::npos);
}

TEST(VerifiedCopierTest, PrimitiveFailureIsPropagated)
{
    TempDir dir;
    const auto src = dir / "src" / "a.txt";
    write_file(src, "data");

    VerifiedCopier copier([](const fs::path&, const fs::path&) -> rcopy::infra::VoidResult {
        return std::unexpected(rcopy::infra::make_error(ErrorCode::DiskFull, "No space left on device"));
    });

    auto res = copier.copy(src, dir / "dst" / "a.txt");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::DiskFull);
}

TEST(VerifiedCopierTest, EmptyFileCopies)
{
    TempDir dir;
    const auto src = dir / "src" / "empty";
    write_file(src, "");

    VerifiedCopier copier;
    ASSERT_TRUE(copier.copy(src, dir / "dst" / "empty").has_value());
    EXPECT_TRUE(fs::exists(dir / "dst" / "empty"));
}

TEST(FsAdapterTest, MMapStrategyCopiesLargeFile)
{
    TempDir dir;
    const auto src = dir / "large.bin";
    std::string payload(2'000'000, '\0');
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>(i % 251);
    }
    write_file(src, payload);

    EXPECT_EQ(rcopy::adapters::fs::select_strategy(payload.size()), rcopy::adapters::fs::CopyStrategy::MMap);
    ASSERT_TRUE(rcopy::adapters::fs::copy_file_auto(src, dir / "copy.bin").has_value());
    EXPECT_EQ(read_file(dir / "copy.bin"), payload);
}

TEST(FsAdapterTest, FileSizeOfMissingFileIsNotFound)
{
    TempDir dir;
    auto size = rcopy::adapters::fs::file_size(dir / "nope");
    ASSERT_FALSE(size.has_value());
    EXPECT_EQ(size.error().code, ErrorCode::FileNotFound);
}
