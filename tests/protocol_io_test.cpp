#include <gtest/gtest.h>

#include "../common/protocol_io.hpp"

#include <string>
#include <vector>

TEST(ProtocolIoTest, FrameHeaderIsBigEndianOnTheWire)
{
    FrameHeader h{};
    h.msg_type    = static_cast<u16>(MsgType::MT_RESTORE_CHUNK);
    h.flags       = 0x0102;
    h.payload_len = 1024;

    u8 buf[8];
    proto::encode_header(h, buf);

    const u8 expected[8] = {0x00, 0x02, 0x01, 0x02, 0x00, 0x00, 0x04, 0x00};
    for (int i = 0; i < 8; ++i) {
        EXPECT_EQ(buf[i], expected[i]) << "byte " << i;
    }

    FrameHeader back = proto::decode_header(buf);
    EXPECT_EQ(back.msg_type, h.msg_type);
    EXPECT_EQ(back.flags, h.flags);
    EXPECT_EQ(back.payload_len, h.payload_len);
}

TEST(ProtocolIoTest, ResultCarriesStatusAndMessage)
{
    RestoreResult r = RestoreResult::failure(RestoreStatus::ERR_INVALID_SNAPSHOT,
                                             "snapshot digest mismatch");
    std::vector<u8> body = proto::encode_result(r);
    ASSERT_EQ(body.size(), sizeof(ResultHdr) + r.message.size());

    RestoreResult back = proto::decode_result(body);
    EXPECT_EQ(back.status, RestoreStatus::ERR_INVALID_SNAPSHOT);
    EXPECT_EQ(back.message, "snapshot digest mismatch");
    EXPECT_FALSE(back.ok());
}

TEST(ProtocolIoTest, SuccessResultHasNoMessage)
{
    std::vector<u8> body = proto::encode_result(RestoreResult::success());
    EXPECT_EQ(body.size(), sizeof(ResultHdr));
    EXPECT_TRUE(proto::decode_result(body).ok());
}

TEST(ProtocolIoTest, LongResultMessageIsTruncated)
{
    RestoreResult r = RestoreResult::failure(RestoreStatus::ERR_APPLY,
                                             std::string(MAX_RESULT_MESSAGE + 500, 'x'));
    std::vector<u8> body = proto::encode_result(r);
    EXPECT_EQ(body.size(), sizeof(ResultHdr) + MAX_RESULT_MESSAGE);
    EXPECT_EQ(proto::decode_result(body).message.size(), MAX_RESULT_MESSAGE);
}

TEST(ProtocolIoTest, MalformedResultIsRejected)
{
    EXPECT_THROW(proto::decode_result(std::vector<u8>{0, 0, 0}), ProtocolError);

    // Declares a 10-byte message but carries 2
    std::vector<u8> body = proto::encode_result(RestoreResult::success());
    body[7] = 10;
    body.push_back('h');
    body.push_back('i');
    EXPECT_THROW(proto::decode_result(body), ProtocolError);

    // Status past the last known code
    std::vector<u8> unknown = proto::encode_result(RestoreResult::success());
    unknown[3] = 99;
    EXPECT_THROW(proto::decode_result(unknown), ProtocolError);
}

TEST(ProtocolIoTest, StatusNamesAreDistinct)
{
    EXPECT_STREQ(restore_status_str(RestoreStatus::OK), "ok");
    EXPECT_STRNE(restore_status_str(RestoreStatus::ERR_PROTOCOL),
                 restore_status_str(RestoreStatus::ERR_INVALID_SNAPSHOT));
}
