#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "cokacenc/core/ChunkService.hpp"
#include "cokacenc/crypto/providers/OpenSslProviderFactory.hpp"

namespace
{

using cokacenc::core::ChunkError;
using cokacenc::core::ChunkName;

constexpr const char* g_kName{ "big.bin" };
constexpr const char* g_kFn5{ "21c83" };
constexpr const char* g_kContent{ "0123abcd" };

[[nodiscard]] ChunkName split(std::uint32_t seq, std::string content = g_kContent)
{
    return ChunkName{ .fnHash5 = g_kFn5, .contentHash8 = std::move(content), .sequence = seq, .originalName = g_kName };
}

[[nodiscard]] ChunkName single(std::string content = g_kContent)
{
    return ChunkName{ .fnHash5 = g_kFn5,
                      .contentHash8 = std::move(content),
                      .sequence = std::nullopt,
                      .originalName = g_kName };
}

[[nodiscard]] std::filesystem::path chunkPath(const ChunkName& n)
{
    return std::filesystem::path{ "/data" } / cokacenc::core::encodeChunkName(n);
}

} // namespace

TEST(ValidateChunkGroup, AcceptsSingleAndContiguousSplit)
{
    EXPECT_FALSE(cokacenc::core::validateChunkGroup(std::vector{ single() }).has_value());
    EXPECT_FALSE(cokacenc::core::validateChunkGroup(std::vector{ split(0U), split(1U), split(2U) }).has_value());
}

TEST(ValidateChunkGroup, ClassifiesDefects)
{
    EXPECT_EQ(cokacenc::core::validateChunkGroup({}), ChunkError::IncompleteGroup);
    EXPECT_EQ(cokacenc::core::validateChunkGroup(std::vector{ split(0U) }), ChunkError::IncompleteGroup);
    EXPECT_EQ(cokacenc::core::validateChunkGroup(std::vector{ split(1U), split(2U) }), ChunkError::SequenceGap);
    EXPECT_EQ(cokacenc::core::validateChunkGroup(std::vector{ split(0U), split(2U) }), ChunkError::SequenceGap);
    EXPECT_EQ(cokacenc::core::validateChunkGroup(std::vector{ split(0U), split(0U), split(1U) }),
              ChunkError::DuplicateSequence);
    EXPECT_EQ(cokacenc::core::validateChunkGroup(std::vector{ single(), single() }), ChunkError::DuplicateSequence);
    EXPECT_EQ(cokacenc::core::validateChunkGroup(std::vector{ single(), split(0U) }), ChunkError::MixedGroup);
    EXPECT_EQ(cokacenc::core::validateChunkGroup(std::vector{ split(0U), split(1U, "ffffffff") }),
              ChunkError::ContentHashMismatch);
}

class GroupAndOrderTest : public ::testing::Test
{
protected:
    std::unique_ptr<cokacenc::crypto::ICryptoProvider> m_crypto{
        cokacenc::crypto::providers::makeOpenSslCryptoProvider()
    };
    cokacenc::core::ChunkService m_service{ *m_crypto };
};

TEST_F(GroupAndOrderTest, OrdersBySequenceNotByListing)
{
    const std::vector<std::filesystem::path> listing{ chunkPath(split(2U)), chunkPath(split(0U)),
                                                      chunkPath(split(1U)) };
    const auto grouped{ m_service.groupAndOrder(listing) };

    ASSERT_EQ(grouped.groups.size(), 1U);
    EXPECT_TRUE(grouped.malformed.empty());
    const auto& [key, paths]{ *grouped.groups.begin() };
    EXPECT_EQ(key.originalName, g_kName);
    EXPECT_EQ(key.fnHash5, g_kFn5);
    ASSERT_EQ(paths.size(), 3U);
    EXPECT_EQ(paths[0], listing[1]);
    EXPECT_EQ(paths[1], listing[2]);
    EXPECT_EQ(paths[2], listing[0]);
}

TEST_F(GroupAndOrderTest, IgnoresNamesThatAreNotChunks)
{
    const std::vector<std::filesystem::path> listing{ "/data/readme.txt", "/data/.big.bin.cokacenc-unpacking",
                                                      "/data/.21c83.aaaa.big.bin.cokacenc-partial",
                                                      "/data/21c83.0123abcd.big.bin.cokacenc.bak" };
    const auto grouped{ m_service.groupAndOrder(listing) };
    EXPECT_TRUE(grouped.groups.empty());
    EXPECT_TRUE(grouped.malformed.empty());
}

TEST_F(GroupAndOrderTest, SeparatesFilesAndReportsBrokenGroups)
{
    const ChunkName other{ .fnHash5 = cokacenc::core::fileNameFingerprint("x.txt"),
                           .contentHash8 = "90015098",
                           .sequence = std::nullopt,
                           .originalName = "x.txt" };
    const std::vector<std::filesystem::path> listing{ chunkPath(split(0U)), chunkPath(other), chunkPath(split(2U)) };

    const auto grouped{ m_service.groupAndOrder(listing) };
    ASSERT_EQ(grouped.groups.size(), 1U);
    EXPECT_EQ(grouped.groups.begin()->first.originalName, "x.txt");

    ASSERT_EQ(grouped.malformed.size(), 1U);
    EXPECT_EQ(grouped.malformed[0].key.originalName, g_kName);
    EXPECT_EQ(grouped.malformed[0].error, ChunkError::SequenceGap);
    EXPECT_EQ(grouped.malformed[0].paths.size(), 2U);
}

TEST_F(GroupAndOrderTest, MixedSingleAndSplitMembersAreRejected)
{
    const std::vector<std::filesystem::path> listing{ chunkPath(single()), chunkPath(split(0U)),
                                                      chunkPath(split(1U)) };
    const auto grouped{ m_service.groupAndOrder(listing) };
    EXPECT_TRUE(grouped.groups.empty());
    ASSERT_EQ(grouped.malformed.size(), 1U);
    EXPECT_EQ(grouped.malformed[0].error, ChunkError::MixedGroup);
}

TEST_F(GroupAndOrderTest, LeftoversFromAnOlderPackAreAContentMismatch)
{
    const std::vector<std::filesystem::path> listing{ chunkPath(split(0U)), chunkPath(split(1U)),
                                                      chunkPath(split(1U, "99999999")) };
    const auto grouped{ m_service.groupAndOrder(listing) };
    EXPECT_TRUE(grouped.groups.empty());
    ASSERT_EQ(grouped.malformed.size(), 1U);
    EXPECT_EQ(grouped.malformed[0].error, ChunkError::ContentHashMismatch);
}

TEST_F(GroupAndOrderTest, UnpackGroupRejectsMembersOfDifferentFiles)
{
    const ChunkName other{ .fnHash5 = cokacenc::core::fileNameFingerprint("x.txt"),
                           .contentHash8 = g_kContent,
                           .sequence = 1U,
                           .originalName = "x.txt" };
    const std::vector<std::filesystem::path> paths{ chunkPath(split(0U)), chunkPath(other) };
    const auto secret{ cokacenc::security::secureStringFrom("a2V5") };

    const auto result{ m_service.unpackGroup(paths, secret, {}) };
    ASSERT_TRUE(std::holds_alternative<cokacenc::core::ChunkFailure>(result));
    EXPECT_EQ(std::get<cokacenc::core::ChunkFailure>(result).code, ChunkError::MixedGroup);
}

TEST_F(GroupAndOrderTest, UnpackGroupOfNothingIsIncomplete)
{
    const auto secret{ cokacenc::security::secureStringFrom("a2V5") };
    const auto result{ m_service.unpackGroup({}, secret, {}) };
    ASSERT_TRUE(std::holds_alternative<cokacenc::core::ChunkFailure>(result));
    EXPECT_EQ(std::get<cokacenc::core::ChunkFailure>(result).code, ChunkError::IncompleteGroup);
}
