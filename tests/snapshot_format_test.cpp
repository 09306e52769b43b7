#include <gtest/gtest.h>

#include "../common/snapshot_format.hpp"
#include "../common/protocol_io.hpp"
#include "test_util.hpp"

#include <cstring>
#include <string>
#include <vector>

namespace {

// Expect validate() to fail with a message containing 'needle'
void expect_rejected(const std::vector<u8>& image, const std::string& needle)
{
    try {
        snapshot::validate(image.data(), image.size());
        FAIL() << "expected SnapshotError containing '" << needle << "'";
    } catch (const SnapshotError& e) {
        EXPECT_NE(std::string(e.what()).find(needle), std::string::npos) << e.what();
    }
}

} // namespace

TEST(SnapshotFormatTest, PlainSnapshotValidates)
{
    std::vector<u8> image = snapshot::build("key=value\n");
    ASSERT_EQ(image.size(), sizeof(SnapshotHeader) + 10);

    snapshot::SnapshotInfo info = snapshot::validate(image.data(), image.size());
    EXPECT_EQ(info.algo, CompressAlgo::NONE);
    EXPECT_EQ(info.raw_size, 10u);
    EXPECT_EQ(info.stored_size, 10u);
    EXPECT_EQ(info.digest, hash::xxh3_128("key=value\n", 10));
}

TEST(SnapshotFormatTest, ZstdSnapshotValidates)
{
    std::vector<u8> payload = testutil::sequential_bytes(200000);
    std::vector<u8> image = snapshot::build(payload.data(), payload.size(), CompressAlgo::ZSTD);
    EXPECT_LT(image.size(), payload.size());

    snapshot::SnapshotInfo info = snapshot::validate(image.data(), image.size());
    EXPECT_EQ(info.algo, CompressAlgo::ZSTD);
    EXPECT_EQ(info.raw_size, payload.size());
    EXPECT_EQ(info.digest, hash::xxh3_128(payload.data(), payload.size()));
}

TEST(SnapshotFormatTest, ByteVectorPayloadBuildsSameImage)
{
    std::vector<u8> payload = testutil::sequential_bytes(3000);
    std::vector<u8> image = snapshot::build(payload);
    EXPECT_EQ(image, snapshot::build(payload.data(), payload.size()));

    snapshot::SnapshotInfo info = snapshot::validate(image.data(), image.size());
    EXPECT_EQ(info.raw_size, payload.size());
    EXPECT_EQ(info.digest, hash::xxh3_128(payload.data(), payload.size()));
}

TEST(SnapshotFormatTest, EmptyPayloadInsideContainerIsValid)
{
    std::vector<u8> image = snapshot::build("");
    EXPECT_EQ(image.size(), sizeof(SnapshotHeader));
    EXPECT_NO_THROW(snapshot::validate(image.data(), image.size()));
}

TEST(SnapshotFormatTest, EmptyBufferIsNeverASnapshot)
{
    expect_rejected({}, "empty");
}

TEST(SnapshotFormatTest, ArbitraryBytesAreRejected)
{
    expect_rejected(testutil::bytes("AAAABBBBCCCC"), "truncated");
    expect_rejected(std::vector<u8>(64, 0x41), "magic");
}

TEST(SnapshotFormatTest, HeaderDefectsAreRejected)
{
    std::vector<u8> good = snapshot::build("payload");

    std::vector<u8> version = good;
    version[4] = 9;
    expect_rejected(version, "version");

    std::vector<u8> algo = good;
    algo[5] = 7;
    expect_rejected(algo, "compression");

    std::vector<u8> longer = good;
    longer.push_back('!');
    expect_rejected(longer, "length mismatch");

    std::vector<u8> shorter = good;
    shorter.pop_back();
    expect_rejected(shorter, "length mismatch");
}

TEST(SnapshotFormatTest, FlippedPayloadByteFailsDigest)
{
    std::vector<u8> image = snapshot::build("important state");
    image.back() ^= 0x01;
    expect_rejected(image, "digest");
}

TEST(SnapshotFormatTest, RawSizeMustMatchForUncompressed)
{
    std::vector<u8> image = snapshot::build("abc");
    SnapshotHeader h{};
    std::memcpy(&h, image.data(), sizeof(h));
    h.raw_size = proto::hton64(4);
    std::memcpy(image.data(), &h, sizeof(h));
    expect_rejected(image, "raw_size");
}

TEST(SnapshotFormatTest, CorruptZstdPayloadIsRejected)
{
    std::vector<u8> payload = testutil::sequential_bytes(5000);
    std::vector<u8> image = snapshot::build(payload.data(), payload.size(), CompressAlgo::ZSTD);

    std::vector<u8> garbled = image;
    for (size_t i = sizeof(SnapshotHeader); i < garbled.size(); ++i) garbled[i] = 0xFF;
    EXPECT_THROW(snapshot::validate(garbled.data(), garbled.size()), SnapshotError);

    // Declared raw size smaller than what the stream inflates to
    std::vector<u8> lying = image;
    SnapshotHeader h{};
    std::memcpy(&h, lying.data(), sizeof(h));
    h.raw_size = proto::hton64(100);
    std::memcpy(lying.data(), &h, sizeof(h));
    EXPECT_THROW(snapshot::validate(lying.data(), lying.size()), SnapshotError);
}
