#include <cstdint>
#include <string_view>
#include <gtest/gtest.h>
#include "Commands.h"
#include "PNG.h"
#include "TestImages.h"

TEST(CommandsTests, EncodeThenDecode)
{
    auto encoded = Commands::Encode(TestImages::MinimalImageBytes(), "RuST", "hello");
    ASSERT_TRUE(encoded);

    auto message = Commands::Decode(encoded.value(), "RuST");
    ASSERT_TRUE(message);
    EXPECT_EQ(message.value(), "hello");
}

TEST(CommandsTests, EncodeAppendsAfterExistingChunks)
{
    auto encoded = Commands::Encode(TestImages::MinimalImageBytes(), "RuST", "hello");
    ASSERT_TRUE(encoded);

    auto png = PNG::Parse(encoded.value());
    ASSERT_TRUE(png);
    ASSERT_EQ(png->Chunks().size(), 4u);
    EXPECT_EQ(png->Chunks()[2].Type(), ChunkIdentifiers::imageTrailer);
    EXPECT_EQ(png->Chunks()[3].Type().ToString(), "RuST");
}

TEST(CommandsTests, EncodeKeepsUtf8Message)
{
    const std::string message = "gr\xC3\xBC\xC3\x9F dich";
    auto encoded = Commands::Encode(TestImages::MinimalImageBytes(), "ruSt", message);
    ASSERT_TRUE(encoded);
    EXPECT_EQ(Commands::Decode(encoded.value(), "ruSt").value(), message);
}

TEST(CommandsTests, EncodeRejectsBadChunkTypes)
{
    const std::vector<Byte> file = TestImages::MinimalImageBytes();

    auto notLetters = Commands::Encode(file, "Ru5T", "hello");
    ASSERT_FALSE(notLetters);
    EXPECT_EQ(notLetters.error(), PNGError::Invalid_Chunk_Type);

    auto tooShort = Commands::Encode(file, "RuS", "hello");
    ASSERT_FALSE(tooShort);
    EXPECT_EQ(tooShort.error(), PNGError::Invalid_Chunk_Type);

    auto reservedBit = Commands::Encode(file, "Rust", "hello");
    ASSERT_FALSE(reservedBit);
    EXPECT_EQ(reservedBit.error(), PNGError::Reserved_Bit_Invalid);
    EXPECT_EQ(KindOf(reservedBit.error()), ErrorKind::Format);
}

TEST(CommandsTests, MessageLengthMustFitLengthField)
{
    EXPECT_TRUE(Chunk::FitsInChunk(0));
    EXPECT_TRUE(Chunk::FitsInChunk(Chunk::maxDataSize));
    EXPECT_EQ(Chunk::maxDataSize, std::size_t{ 0xFFFFFFFF });
    if constexpr(sizeof(std::size_t) > sizeof(std::uint32_t))
        EXPECT_FALSE(Chunk::FitsInChunk(Chunk::maxDataSize + 1));

    EXPECT_EQ(KindOf(PNGError::Data_Too_Large), ErrorKind::Format);
}

TEST(CommandsTests, DecodeRejectsBadChunkTypes)
{
    auto encoded = Commands::Encode(TestImages::MinimalImageBytes(), "RuST", "hello");
    ASSERT_TRUE(encoded);

    for(std::string_view type : { "Ru5T", "RuS", "ab", "RuSTy" })
    {
        auto message = Commands::Decode(encoded.value(), type);
        ASSERT_FALSE(message) << type;
        EXPECT_EQ(message.error(), PNGError::Invalid_Chunk_Type) << type;
        EXPECT_EQ(KindOf(message.error()), ErrorKind::Format) << type;
    }
}

TEST(CommandsTests, RemoveRejectsBadChunkTypes)
{
    auto encoded = Commands::Encode(TestImages::MinimalImageBytes(), "RuST", "hello");
    ASSERT_TRUE(encoded);

    for(std::string_view type : { "Ru5T", "RuS", "ab", "RuSTy" })
    {
        auto removed = Commands::Remove(encoded.value(), type);
        ASSERT_FALSE(removed) << type;
        EXPECT_EQ(removed.error(), PNGError::Invalid_Chunk_Type) << type;
    }
}

TEST(CommandsTests, DecodeChecksTypeBeforeFile)
{
    std::vector<Byte> file = TestImages::MinimalImageBytes();
    file[0] = 0;

    auto message = Commands::Decode(file, "RuS");
    ASSERT_FALSE(message);
    EXPECT_EQ(message.error(), PNGError::Invalid_Chunk_Type);
}

TEST(CommandsTests, EncodeRejectsMalformedFile)
{
    std::vector<Byte> file = TestImages::MinimalImageBytes();
    file[0] = 0;

    auto encoded = Commands::Encode(file, "RuST", "hello");
    ASSERT_FALSE(encoded);
    EXPECT_EQ(encoded.error(), PNGError::Unknown_Signature);
}

TEST(CommandsTests, DecodeMissingTypeIsNotFound)
{
    auto message = Commands::Decode(TestImages::MinimalImageBytes(), "RuST");
    ASSERT_FALSE(message);
    EXPECT_EQ(message.error(), PNGError::Chunk_Not_Found);
}

TEST(CommandsTests, DecodeBinaryPayloadIsEncodingError)
{
    PNG png = TestImages::MinimalImage();
    png.AppendChunk(Chunk{ "RuST"_ct, { 0xFF, 0xFE } });

    auto message = Commands::Decode(png.AsBytes(), "RuST");
    ASSERT_FALSE(message);
    EXPECT_EQ(message.error(), PNGError::Invalid_Utf8);
}

TEST(CommandsTests, RemoveRestoresOriginalBytes)
{
    const std::vector<Byte> original = TestImages::MinimalImageBytes();

    auto encoded = Commands::Encode(original, "RuST", "msg");
    ASSERT_TRUE(encoded);

    auto removed = Commands::Remove(encoded.value(), "RuST");
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed.value(), original);
}

TEST(CommandsTests, RemoveChunkReturnsRemovedChunk)
{
    auto encoded = Commands::Encode(TestImages::MinimalImageBytes(), "RuST", "msg");
    ASSERT_TRUE(encoded);

    auto removed = Commands::RemoveChunk(encoded.value(), "RuST");
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed->chunk.DataAsString().value(), "msg");
    EXPECT_EQ(removed->file, TestImages::MinimalImageBytes());
}

TEST(CommandsTests, RemoveTwiceFails)
{
    auto encoded = Commands::Encode(TestImages::MinimalImageBytes(), "RuST", "msg");
    ASSERT_TRUE(encoded);

    auto once = Commands::Remove(encoded.value(), "RuST");
    ASSERT_TRUE(once);

    auto twice = Commands::Remove(once.value(), "RuST");
    ASSERT_FALSE(twice);
    EXPECT_EQ(twice.error(), PNGError::Chunk_Not_Found);
}

TEST(CommandsTests, PrintSummarisesEveryChunk)
{
    auto encoded = Commands::Encode(TestImages::MinimalImageBytes(), "ruSt", "hello");
    ASSERT_TRUE(encoded);

    auto summaries = Commands::Print(encoded.value());
    ASSERT_TRUE(summaries);
    ASSERT_EQ(summaries->size(), 4u);

    const Commands::ChunkSummary& header = summaries->at(0);
    EXPECT_EQ(header.type, "IHDR");
    EXPECT_EQ(header.standardName, "Image Header");
    EXPECT_TRUE(header.critical);
    EXPECT_TRUE(header.isPublic);
    EXPECT_FALSE(header.safeToCopy);
    EXPECT_EQ(header.length, 13u);

    const Commands::ChunkSummary& secret = summaries->at(3);
    EXPECT_EQ(secret.type, "ruSt");
    EXPECT_TRUE(secret.standardName.empty());
    EXPECT_FALSE(secret.critical);
    EXPECT_FALSE(secret.isPublic);
    EXPECT_TRUE(secret.safeToCopy);
    EXPECT_EQ(secret.length, 5u);
    EXPECT_EQ(secret.description, "Chunk Type: ruSt\nData: hello");
}

TEST(CommandsTests, PrintShowsBinaryDataAsBytes)
{
    PNG png = TestImages::MinimalImage();
    png.AppendChunk(Chunk{ "RuSt"_ct, { 0xFF, 0x00, 7 } });

    auto summaries = Commands::Print(png.AsBytes());
    ASSERT_TRUE(summaries);
    ASSERT_EQ(summaries->size(), 4u);
    EXPECT_EQ(summaries->at(3).description, "Chunk Type: RuSt\nData: [255, 0, 7]");

    const std::string line = Commands::FormatSummary(summaries->at(3));
    EXPECT_NE(line.find("length: 3"), std::string::npos);
    EXPECT_NE(line.find("\nChunk Type: RuSt\nData: [255, 0, 7]"), std::string::npos);
}

TEST(CommandsTests, FormatSummary)
{
    const Commands::ChunkSummary trailer{
        .type = "IEND",
        .standardName = "Image Trailer",
        .critical = true,
        .isPublic = true,
        .safeToCopy = false,
        .length = 0,
        .crc = 0xAE426082,
        .description = "Chunk Type: IEND\nData: " };

    EXPECT_EQ(Commands::FormatSummary(trailer),
        "IEND  critical   public   unsafe-to-copy  length: 0  crc: 0xAE426082  (Image Trailer)\n"
        "Chunk Type: IEND\nData: ");
}

TEST(CommandsTests, PrintRejectsMalformedFile)
{
    std::vector<Byte> file = TestImages::MinimalImageBytes();
    file.pop_back();

    auto summaries = Commands::Print(file);
    ASSERT_FALSE(summaries);
    EXPECT_EQ(summaries.error(), PNGError::Insufficient_Size);
}
