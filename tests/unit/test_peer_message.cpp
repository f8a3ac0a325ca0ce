#include <gtest/gtest.h>
#include "handoff/network/peer_message.hpp"

using namespace handoff::network;

class PeerMessageTest : public ::testing::Test {
protected:
    static PeerMessage round_trip(const PeerMessage& message) {
        auto wire = message.serialize();
        return PeerMessage::deserialize(wire);
    }
};

TEST_F(PeerMessageTest, EnvelopeLayout) {
    auto message = PeerMessage::make(ConnectionDeniedMessage{"busy"});
    message.timestamp = 0x0102030405060708ULL;
    auto wire = message.serialize();
    
    ASSERT_GE(wire.size(), ENVELOPE_SIZE);
    EXPECT_EQ(wire[0], 'H');
    EXPECT_EQ(wire[1], 'N');
    EXPECT_EQ(wire[2], 'D');
    EXPECT_EQ(wire[3], 'F');
    EXPECT_EQ(wire[4], 0x00);
    EXPECT_EQ(wire[5], PROTOCOL_VERSION);
    EXPECT_EQ(wire[6], static_cast<std::uint8_t>(MessageType::CONNECTION_DENIED));
    EXPECT_EQ(wire[8], 0x01);
    EXPECT_EQ(wire[15], 0x08);
    
    std::uint32_t payload_size = (wire[16] << 24) | (wire[17] << 16) | (wire[18] << 8) | wire[19];
    EXPECT_EQ(payload_size, wire.size() - ENVELOPE_SIZE);
}

TEST_F(PeerMessageTest, MakeStampsWallClock) {
    auto message = PeerMessage::make(HeartbeatMessage{});
    EXPECT_GT(message.timestamp, 1577836800000ULL);
    EXPECT_EQ(message.type(), MessageType::HEARTBEAT);
}

TEST_F(PeerMessageTest, ConnectionRequestSurvivesTheWire) {
    auto decoded = round_trip(PeerMessage::make(ConnectionRequestMessage{"client-abc", "Linux 6.1 (laptop)"}));
    
    auto* body = decoded.get_if<ConnectionRequestMessage>();
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(body->peer_id, "client-abc");
    EXPECT_EQ(body->device_info, "Linux 6.1 (laptop)");
}

TEST_F(PeerMessageTest, FileMetadataKeepsOptionalHash) {
    FileMetadataMessage with_hash;
    with_hash.id = "f1";
    with_hash.name = "photo.jpg";
    with_hash.size = 3 * 65536 + 17;
    with_hash.mime_type = "image/jpeg";
    with_hash.last_modified = 1700000000000ULL;
    with_hash.total_chunks = 4;
    with_hash.batch_id = "b1";
    with_hash.file_index = 2;
    with_hash.total_files_in_batch = 3;
    with_hash.hash = "0011223344556677";
    
    auto decoded = round_trip(PeerMessage::make(with_hash));
    auto* body = decoded.get_if<FileMetadataMessage>();
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(body->size, with_hash.size);
    EXPECT_EQ(body->file_index, 2u);
    EXPECT_EQ(body->total_files_in_batch, 3u);
    ASSERT_TRUE(body->hash.has_value());
    EXPECT_EQ(*body->hash, "0011223344556677");
    
    FileMetadataMessage without_hash = with_hash;
    without_hash.hash.reset();
    auto plain = round_trip(PeerMessage::make(without_hash));
    EXPECT_FALSE(plain.get_if<FileMetadataMessage>()->hash.has_value());
}

TEST_F(PeerMessageTest, FileChunkCarriesBinaryData) {
    FileChunkMessage chunk;
    chunk.file_id = "f1";
    chunk.chunk_index = 7;
    chunk.total_chunks = 9;
    chunk.data = {0x00, 0xFF, 0x10, 0x00, 0x7F};
    chunk.checksum = "deadbeefdeadbeef";
    
    auto decoded = round_trip(PeerMessage::make(chunk));
    auto* body = decoded.get_if<FileChunkMessage>();
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(body->chunk_index, 7u);
    EXPECT_EQ(body->data, chunk.data);
    EXPECT_EQ(body->checksum, chunk.checksum);
}

TEST_F(PeerMessageTest, TruncatedEnvelopeThrows) {
    auto wire = PeerMessage::make(PinInvalidMessage{2}).serialize();
    wire.resize(ENVELOPE_SIZE - 1);
    EXPECT_THROW(PeerMessage::deserialize(wire), std::runtime_error);
}

TEST_F(PeerMessageTest, TruncatedPayloadThrows) {
    auto wire = PeerMessage::make(ConnectionRequestMessage{"client-abc", "device"}).serialize();
    wire.pop_back();
    EXPECT_THROW(PeerMessage::deserialize(wire), std::runtime_error);
}

TEST_F(PeerMessageTest, BadMagicThrows) {
    auto wire = PeerMessage::make(HeartbeatMessage{}).serialize();
    wire[0] = 'X';
    EXPECT_THROW(PeerMessage::deserialize(wire), std::runtime_error);
}

TEST_F(PeerMessageTest, UnknownTypeThrows) {
    auto wire = PeerMessage::make(HeartbeatMessage{}).serialize();
    wire[6] = 0x7E;
    EXPECT_THROW(PeerMessage::deserialize(wire), std::runtime_error);
}

TEST_F(PeerMessageTest, PayloadOnEmptyMessageThrows) {
    auto wire = PeerMessage::make(DisconnectMessage{}).serialize();
    wire.push_back(0x01);
    wire[19] = 0x01;
    EXPECT_THROW(PeerMessage::deserialize(wire), std::runtime_error);
}

TEST_F(PeerMessageTest, TypeNames) {
    EXPECT_EQ(message_type_name(MessageType::PIN_ATTEMPT), "pin_attempt");
    EXPECT_EQ(message_type_name(MessageType::BATCH_COMPLETE), "batch_complete");
    EXPECT_EQ(message_type_name(MessageType::DISCONNECT), "disconnect");
}
