#include "syncmd/server/peer_connection.hpp"
#include "syncmd/sync/merkle_tree.hpp"
#include "support/test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>
#include <thread>

namespace fs = std::filesystem;

using namespace syncmd;
using namespace syncmd::test_support;

namespace {

std::string zero_digest() {
    return std::string(64, '0');
}

} // namespace

class PeerConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_root_ = create_temp_dir("syncmd_peer_server");
        client_root_ = create_temp_dir("syncmd_peer_client");
        pair_ = make_loopback_pair();
        client_ = std::make_unique<protocol::EnvelopeChannel>(*pair_->left);
    }

    void TearDown() override {
        pair_->left->close();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        remove_tree(server_root_);
        remove_tree(client_root_);
    }

    void start_server(const server::Authenticator& authenticator) {
        context_ = std::make_unique<server::ResponderContext>(server::ResponderContext{
            "server", server_root_, authenticator, devices_, server_transfers_, nullptr});
        connection_ = std::make_unique<server::PeerConnection>(*pair_->right, "127.0.0.1:0", *context_);
        server_thread_ = std::thread([this] { connection_->serve(); });
    }

    void finish_server() {
        pair_->left->close();
        server_thread_.join();
    }

    protocol::HandshakeResponse handshake(const std::string& device_id) {
        EXPECT_TRUE(client_->send(protocol::HandshakeRequest{device_id, "Laptop", "root_digest", zero_digest()})
                        .is_ok());
        auto reply = client_->receive();
        EXPECT_TRUE(reply.is_ok());
        return std::get<protocol::HandshakeResponse>(reply.value());
    }

    fs::path server_root_;
    fs::path client_root_;
    server::DeviceRegistry devices_;
    transfer::TransferRegistry server_transfers_;
    transfer::TransferRegistry client_transfers_;
    std::unique_ptr<LoopbackPair> pair_;
    std::unique_ptr<protocol::EnvelopeChannel> client_;
    std::unique_ptr<server::ResponderContext> context_;
    std::unique_ptr<server::PeerConnection> connection_;
    std::thread server_thread_;
};

TEST_F(PeerConnectionTest, HandshakeAcceptedAndRecorded) {
    server::RootDigestAuthenticator authenticator;
    start_server(authenticator);

    auto response = handshake("laptop");
    EXPECT_TRUE(response.accepted);
    EXPECT_EQ(response.device_id, "server");
    EXPECT_EQ(response.identity, "laptop");

    finish_server();
    EXPECT_TRUE(devices_.contains("laptop"));
    EXPECT_EQ(connection_->session_info().state, sync::SessionState::Closed);
    EXPECT_EQ(connection_->session_info().peer_device_id, "laptop");
}

TEST_F(PeerConnectionTest, RejectedHandshakeClosesConnection) {
    server::RootDigestAuthenticator authenticator({"desktop"});
    start_server(authenticator);

    auto response = handshake("laptop");
    EXPECT_FALSE(response.accepted);
    EXPECT_FALSE(response.message.empty());

    auto next = client_->receive();
    EXPECT_TRUE(next.is_error());

    server_thread_.join();
    EXPECT_EQ(connection_->session_info().state, sync::SessionState::Closed);
    EXPECT_FALSE(devices_.contains("laptop"));
}

TEST_F(PeerConnectionTest, EnvelopeBeforeHandshakeIsProtocolViolation) {
    server::RootDigestAuthenticator authenticator;
    start_server(authenticator);

    ASSERT_TRUE(client_->send(protocol::Heartbeat{0, false}).is_ok());
    auto next = client_->receive();
    EXPECT_TRUE(next.is_error());

    server_thread_.join();
    EXPECT_EQ(connection_->session_info().state, sync::SessionState::Error);
    EXPECT_FALSE(connection_->session_info().last_error.empty());
}

TEST_F(PeerConnectionTest, HeartbeatAnsweredWithReply) {
    server::RootDigestAuthenticator authenticator;
    start_server(authenticator);
    ASSERT_TRUE(handshake("laptop").accepted);

    ASSERT_TRUE(client_->send(protocol::Heartbeat{1234, false}).is_ok());
    auto reply = client_->receive();
    ASSERT_TRUE(reply.is_ok());
    const auto* heartbeat = std::get_if<protocol::Heartbeat>(&reply.value());
    ASSERT_NE(heartbeat, nullptr);
    EXPECT_TRUE(heartbeat->reply);

    finish_server();
    EXPECT_EQ(connection_->session_info().state, sync::SessionState::Closed);
}

TEST_F(PeerConnectionTest, SyncExchangesFilesBothWays) {
    write_file(server_root_ / "server.md", "from server");
    write_file(client_root_ / "notes" / "client.md", "from client");

    server::RootDigestAuthenticator authenticator;
    start_server(authenticator);
    ASSERT_TRUE(handshake("laptop").accepted);

    sync::SnapshotIndexer indexer("laptop", client_root_);
    auto snapshot = indexer.index();
    ASSERT_TRUE(snapshot.is_ok());

    protocol::SyncRequest request;
    request.device_id = "laptop";
    request.root_digest = sync::root_digest(snapshot.value());
    for (const auto& [_, record] : snapshot.value().files) {
        request.files.push_back(record);
    }
    ASSERT_TRUE(client_->send(request).is_ok());

    auto reply = client_->receive();
    ASSERT_TRUE(reply.is_ok());
    const auto& response = std::get<protocol::SyncResponse>(reply.value());
    ASSERT_EQ(response.operations.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<sync::AddOp>(response.operations[0]));
    EXPECT_EQ(sync::operation_path(response.operations[0]), "server.md");
    ASSERT_EQ(response.requested_paths.size(), 1u);
    EXPECT_EQ(response.requested_paths[0], "notes/client.md");

    transfer::TransferReceiver receiver(client_root_, client_transfers_);
    auto received = receiver.receive_file(*client_);
    ASSERT_TRUE(received.is_ok()) << received.error().describe();
    EXPECT_EQ(received.value().path, "server.md");
    EXPECT_EQ(read_file(client_root_ / "server.md"), "from server");

    transfer::TransferSender sender(*client_);
    auto record = indexer.build_record("notes/client.md");
    ASSERT_TRUE(record.is_ok());
    ASSERT_TRUE(sender.send_file(client_root_ / "notes" / "client.md", record.value()).is_ok());

    // A heartbeat round trip proves the server finished the sync.
    ASSERT_TRUE(client_->send(protocol::Heartbeat{0, false}).is_ok());
    auto pong = client_->receive();
    ASSERT_TRUE(pong.is_ok());
    EXPECT_TRUE(std::holds_alternative<protocol::Heartbeat>(pong.value()));

    EXPECT_EQ(read_file(server_root_ / "notes" / "client.md"), "from client");
    EXPECT_EQ(connection_->session_info().state, sync::SessionState::Idle);

    auto base = devices_.base_snapshot("laptop");
    ASSERT_TRUE(base.has_value());
    EXPECT_TRUE(base->contains("server.md"));
    EXPECT_TRUE(base->contains("notes/client.md"));

    finish_server();
}

TEST_F(PeerConnectionTest, TransferForUnrequestedPathRefused) {
    write_file(client_root_ / "wanted.md", "requested content");
    write_file(client_root_ / "intruder.md", "not requested");

    server::RootDigestAuthenticator authenticator;
    start_server(authenticator);
    ASSERT_TRUE(handshake("laptop").accepted);

    sync::SnapshotIndexer indexer("laptop", client_root_);
    auto wanted = indexer.build_record("wanted.md");
    ASSERT_TRUE(wanted.is_ok());

    protocol::SyncRequest request;
    request.device_id = "laptop";
    request.root_digest = zero_digest();
    request.files.push_back(wanted.value());
    ASSERT_TRUE(client_->send(request).is_ok());

    auto reply = client_->receive();
    ASSERT_TRUE(reply.is_ok());
    const auto& response = std::get<protocol::SyncResponse>(reply.value());
    ASSERT_EQ(response.requested_paths, std::vector<std::string>{"wanted.md"});

    auto intruder = indexer.build_record("intruder.md");
    ASSERT_TRUE(intruder.is_ok());
    transfer::TransferSender sender(*client_);
    auto sent = sender.send_file(client_root_ / "intruder.md", intruder.value());
    ASSERT_TRUE(sent.is_error());
    EXPECT_EQ(sent.error().kind, ErrorKind::Protocol);

    server_thread_.join();
    EXPECT_EQ(connection_->session_info().state, sync::SessionState::Error);
    EXPECT_FALSE(fs::exists(server_root_ / "intruder.md"));
    EXPECT_FALSE(fs::exists(server_root_ / "intruder.md.tmp"));
    EXPECT_FALSE(devices_.base_snapshot("laptop").has_value());
}

TEST_F(PeerConnectionTest, SyncRequestForAnotherDeviceRejected) {
    server::RootDigestAuthenticator authenticator;
    start_server(authenticator);
    ASSERT_TRUE(handshake("laptop").accepted);

    protocol::SyncRequest request;
    request.device_id = "desktop";
    ASSERT_TRUE(client_->send(request).is_ok());
    EXPECT_TRUE(client_->receive().is_error());

    server_thread_.join();
    EXPECT_EQ(connection_->session_info().state, sync::SessionState::Error);
}

TEST_F(PeerConnectionTest, FileRequestFoundAndMissing) {
    write_file(server_root_ / "docs" / "readme.md", "hello");

    server::RootDigestAuthenticator authenticator;
    start_server(authenticator);
    ASSERT_TRUE(handshake("laptop").accepted);

    ASSERT_TRUE(client_->send(protocol::FileRequest{"docs/readme.md"}).is_ok());
    auto reply = client_->receive();
    ASSERT_TRUE(reply.is_ok());
    const auto& found = std::get<protocol::FileResponse>(reply.value());
    ASSERT_TRUE(found.found);
    ASSERT_TRUE(found.record.has_value());
    EXPECT_EQ(found.record->size, 5u);

    transfer::TransferReceiver receiver(client_root_, client_transfers_);
    ASSERT_TRUE(receiver.receive_file(*client_).is_ok());
    EXPECT_EQ(read_file(client_root_ / "docs" / "readme.md"), "hello");

    ASSERT_TRUE(client_->send(protocol::FileRequest{"missing.md"}).is_ok());
    auto missing = client_->receive();
    ASSERT_TRUE(missing.is_ok());
    EXPECT_FALSE(std::get<protocol::FileResponse>(missing.value()).found);

    ASSERT_TRUE(client_->send(protocol::FileRequest{"program.exe"}).is_ok());
    auto untracked = client_->receive();
    ASSERT_TRUE(untracked.is_ok());
    EXPECT_FALSE(std::get<protocol::FileResponse>(untracked.value()).found);

    finish_server();
    EXPECT_EQ(connection_->session_info().state, sync::SessionState::Closed);
}

TEST_F(PeerConnectionTest, FileRequestOutsideRootDropsConnection) {
    server::RootDigestAuthenticator authenticator;
    start_server(authenticator);
    ASSERT_TRUE(handshake("laptop").accepted);

    ASSERT_TRUE(client_->send(protocol::FileRequest{"../secret.md"}).is_ok());
    EXPECT_TRUE(client_->receive().is_error());

    server_thread_.join();
    EXPECT_EQ(connection_->session_info().state, sync::SessionState::Error);
}
