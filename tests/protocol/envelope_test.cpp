#include "syncmd/protocol/envelope.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace syncmd::protocol;
using syncmd::ErrorKind;

namespace {

FileRecord make_record(const std::string& path) {
    FileRecord record;
    record.path = path;
    record.digest = std::string(64, 'a');
    record.size = 12;
    record.modified_time = 1700000000;
    record.created_time = 1700000000;
    record.version = 1700000000;
    record.device_id = "laptop";
    return record;
}

std::string encode_ok(const Envelope& envelope) {
    auto encoded = encode_envelope(envelope);
    EXPECT_TRUE(encoded.is_ok());
    return encoded.is_ok() ? encoded.value() : std::string{};
}

} // namespace

TEST(EnvelopeTest, CarriesTypeTag) {
    const auto json = nlohmann::json::parse(encode_ok(AckChunk{"t1", 4}));
    EXPECT_EQ(json.at("type"), "ack_chunk");
    EXPECT_EQ(json.at("transfer_id"), "t1");
    EXPECT_EQ(json.at("index"), 4);
}

TEST(EnvelopeTest, ChunkBytesSurviveEncoding) {
    ChunkMessage chunk;
    chunk.transfer_id = "t1";
    chunk.index = 2;
    chunk.data = {0x00, 0xff, 0x10, 0x80};
    chunk.digest = "d";

    auto decoded = decode_envelope(encode_ok(chunk));
    ASSERT_TRUE(decoded.is_ok());
    const auto* out = std::get_if<ChunkMessage>(&decoded.value());
    ASSERT_NE(out, nullptr);
    EXPECT_EQ(out->data, chunk.data);
    EXPECT_EQ(out->index, 2u);
}

TEST(EnvelopeTest, SyncResponseKeepsOperationKinds) {
    SyncResponse response;
    response.operations.emplace_back(syncmd::sync::AddOp{make_record("a.md")});
    response.operations.emplace_back(syncmd::sync::UpdateOp{make_record("b.md")});
    response.operations.emplace_back(syncmd::sync::DeleteOp{"c.md"});
    response.requested_paths = {"d.md"};

    auto decoded = decode_envelope(encode_ok(response));
    ASSERT_TRUE(decoded.is_ok());
    const auto* out = std::get_if<SyncResponse>(&decoded.value());
    ASSERT_NE(out, nullptr);
    ASSERT_EQ(out->operations.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<syncmd::sync::AddOp>(out->operations[0]));
    EXPECT_TRUE(std::holds_alternative<syncmd::sync::UpdateOp>(out->operations[1]));
    EXPECT_EQ(std::get<syncmd::sync::DeleteOp>(out->operations[2]).path, "c.md");
    EXPECT_EQ(std::get<syncmd::sync::AddOp>(out->operations[0]).record, make_record("a.md"));
    EXPECT_EQ(out->requested_paths, std::vector<std::string>{"d.md"});
}

TEST(EnvelopeTest, TransferErrorKeepsKindAndIndex) {
    auto decoded = decode_envelope(encode_ok(TransferError{"t9", 3u, ErrorKind::Checksum, "bad chunk"}));
    ASSERT_TRUE(decoded.is_ok());
    const auto& error = std::get<TransferError>(decoded.value());
    EXPECT_EQ(error.kind, ErrorKind::Checksum);
    ASSERT_TRUE(error.index.has_value());
    EXPECT_EQ(*error.index, 3u);
}

TEST(EnvelopeTest, FileResponseWithoutRecord) {
    auto decoded = decode_envelope(encode_ok(FileResponse{"missing.md", false, std::nullopt}));
    ASSERT_TRUE(decoded.is_ok());
    const auto& response = std::get<FileResponse>(decoded.value());
    EXPECT_FALSE(response.found);
    EXPECT_FALSE(response.record.has_value());
}

TEST(EnvelopeTest, MalformedPayloadsAreSerializationErrors) {
    for (const std::string payload : {
             std::string("not json"),
             std::string(R"({"no_type": 1})"),
             std::string(R"({"type": "teleport"})"),
             std::string(R"({"type": "ack_chunk", "transfer_id": "t"})"),
             std::string(R"({"type": "chunk", "transfer_id": "t", "index": 0, "data": "xyz", "digest": "d"})"),
             std::string(R"({"type": "sync_response", "operations": [{"op": "rename"}]})"),
         }) {
        auto decoded = decode_envelope(payload);
        ASSERT_TRUE(decoded.is_error()) << payload;
        EXPECT_EQ(decoded.error().kind, ErrorKind::Serialization) << payload;
    }
}

TEST(EnvelopeTest, FrameLengthIsBigEndian) {
    const auto frame = frame_payload(std::string(0x0102, 'x'));
    ASSERT_EQ(frame.size(), 4u + 0x0102);
    EXPECT_EQ(frame[0], 0x00);
    EXPECT_EQ(frame[1], 0x00);
    EXPECT_EQ(frame[2], 0x01);
    EXPECT_EQ(frame[3], 0x02);
    EXPECT_EQ(read_frame_length(frame.data()), 0x0102u);
}

TEST(EnvelopeTest, TypeNamesMatchWireTags) {
    EXPECT_STREQ(envelope_type(HandshakeRequest{}), "handshake_request");
    EXPECT_STREQ(envelope_type(Heartbeat{}), "heartbeat");
    EXPECT_STREQ(envelope_type(CompleteTransfer{}), "complete_transfer");
}

TEST(EnvelopeTest, InvalidUtf8PathIsSerializationError) {
    SyncRequest request;
    request.device_id = "laptop";
    request.files.push_back(make_record("caf\xe9.md"));

    auto encoded = encode_envelope(request);
    ASSERT_TRUE(encoded.is_error());
    EXPECT_EQ(encoded.error().kind, ErrorKind::Serialization);
}

TEST(EnvelopeTest, InvalidUtf8MessageIsSerializationError) {
    auto encoded = encode_envelope(TransferError{"t1", std::nullopt, ErrorKind::Io, "open \xff\xfe failed"});
    ASSERT_TRUE(encoded.is_error());
    EXPECT_EQ(encoded.error().kind, ErrorKind::Serialization);
}

TEST(EnvelopeTest, Utf8PathEncodes) {
    SyncRequest request;
    request.device_id = "laptop";
    request.files.push_back(make_record("caf\xc3\xa9.md"));

    auto decoded = decode_envelope(encode_ok(request));
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(std::get<SyncRequest>(decoded.value()).files.at(0).path, "caf\xc3\xa9.md");
}
