#include "syncmd/client/sync_client.hpp"
#include "syncmd/events/events.hpp"
#include "syncmd/server/sync_server.hpp"
#include "syncmd/transfer/transfer.hpp"
#include "support/test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

namespace fs = std::filesystem;

using namespace syncmd;
using namespace syncmd::test_support;

class SyncClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_root_ = create_temp_dir("syncmd_client_server");
        client_root_ = create_temp_dir("syncmd_client_local");

        NodeConfig server_config;
        server_config.device_id = "server";
        server_config.sync_root = server_root_;
        server_config.listen_address = "127.0.0.1";
        server_config.listen_port = 0;
        server_config.read_timeout = std::chrono::milliseconds(5000);

        token_ = authority_.issue("laptop", "Laptop");
        server_ = std::make_unique<server::SyncServer>(server_config, authority_, devices_, transfers_);
        ASSERT_TRUE(server_->start().is_ok());
    }

    void TearDown() override {
        client_.reset();
        server_->stop();
        remove_tree(server_root_);
        remove_tree(client_root_);
    }

    NodeConfig client_config(const std::string& token) const {
        NodeConfig config;
        config.device_id = "laptop";
        config.device_name = "Laptop";
        config.sync_root = client_root_;
        config.peer_address = "127.0.0.1";
        config.peer_port = server_->port();
        config.credential_mode = CredentialMode::Token;
        config.auth_token = token;
        config.read_timeout = std::chrono::milliseconds(5000);
        config.debounce_window = std::chrono::milliseconds(60000);
        return config;
    }

    client::SyncClient& make_client(events::EventBus* bus = nullptr) {
        client_ = std::make_unique<client::SyncClient>(client_config(token_), bus);
        return *client_;
    }

    static void set_mtime(const fs::path& path, std::time_t time) {
        fs::last_write_time(path, sync::from_time_t(time));
    }

    fs::path server_root_;
    fs::path client_root_;
    server::TokenAuthority authority_;
    server::DeviceRegistry devices_;
    transfer::TransferRegistry transfers_;
    std::unique_ptr<server::SyncServer> server_;
    std::unique_ptr<client::SyncClient> client_;
    std::string token_;
};

TEST_F(SyncClientTest, SyncAddsFilesInBothDirections) {
    write_file(server_root_ / "server.md", "server notes");
    write_file(client_root_ / "journal" / "today.md", "client notes");

    events::EventBus bus;
    std::atomic<int> completed{0};
    bus.subscribe<events::SyncCompletedEvent>([&](const events::SyncCompletedEvent& event) {
        EXPECT_EQ(event.peer_device_id, "server");
        EXPECT_EQ(event.operations_applied, 1u);
        EXPECT_EQ(event.files_sent, 1u);
        completed++;
    });

    auto& client = make_client(&bus);
    auto outcome = client.sync_once();
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();
    EXPECT_EQ(outcome.value(), client::SyncOutcome::Completed);

    EXPECT_EQ(read_file(client_root_ / "server.md"), "server notes");
    EXPECT_EQ(read_file(server_root_ / "journal" / "today.md"), "client notes");
    EXPECT_EQ(completed, 1);
    EXPECT_EQ(client.peer_device_id(), "server");

    auto info = client.session_info();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, sync::SessionState::Idle);
    EXPECT_TRUE(devices_.contains("laptop"));
}

TEST_F(SyncClientTest, NewerSideWinsConflict) {
    write_file(server_root_ / "shared.md", "old server version");
    write_file(client_root_ / "shared.md", "new client version");
    set_mtime(server_root_ / "shared.md", 1600000000);
    set_mtime(client_root_ / "shared.md", 1700000000);

    auto& client = make_client();
    ASSERT_TRUE(client.sync_once().is_ok());

    EXPECT_EQ(read_file(server_root_ / "shared.md"), "new client version");
    EXPECT_EQ(sync::to_time_t(fs::last_write_time(server_root_ / "shared.md")), 1700000000);
}

TEST_F(SyncClientTest, OlderLocalCopyIsReplaced) {
    write_file(server_root_ / "shared.md", "new server version");
    write_file(client_root_ / "shared.md", "old client version");
    set_mtime(server_root_ / "shared.md", 1700000000);
    set_mtime(client_root_ / "shared.md", 1600000000);

    auto& client = make_client();
    ASSERT_TRUE(client.sync_once().is_ok());

    EXPECT_EQ(read_file(client_root_ / "shared.md"), "new server version");
}

TEST_F(SyncClientTest, DeletionsPropagateOnLaterSync) {
    write_file(server_root_ / "keep.md", "keep");
    write_file(server_root_ / "drop-on-client.md", "a");
    write_file(client_root_ / "drop-on-server.md", "b");

    auto& client = make_client();
    ASSERT_TRUE(client.sync_once().is_ok());
    ASSERT_TRUE(fs::exists(client_root_ / "drop-on-client.md"));
    ASSERT_TRUE(fs::exists(server_root_ / "drop-on-server.md"));

    fs::remove(client_root_ / "drop-on-client.md");
    fs::remove(server_root_ / "drop-on-server.md");

    ASSERT_TRUE(client.sync_once().is_ok());

    EXPECT_FALSE(fs::exists(server_root_ / "drop-on-client.md"));
    EXPECT_FALSE(fs::exists(client_root_ / "drop-on-server.md"));
    EXPECT_TRUE(fs::exists(client_root_ / "keep.md"));
    EXPECT_TRUE(fs::exists(server_root_ / "keep.md"));
}

TEST_F(SyncClientTest, FetchFileDownloadsSingleFile) {
    write_file(server_root_ / "docs" / "guide.md", "# Guide");

    auto& client = make_client();
    auto record = client.fetch_file("docs/guide.md");
    ASSERT_TRUE(record.is_ok()) << record.error().describe();
    EXPECT_EQ(record.value().path, "docs/guide.md");
    EXPECT_EQ(read_file(client_root_ / "docs" / "guide.md"), "# Guide");

    auto missing = client.fetch_file("docs/missing.md");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::Io);
    EXPECT_TRUE(client.is_connected());
}

TEST_F(SyncClientTest, HeartbeatOnAuthenticatedConnection) {
    auto& client = make_client();
    EXPECT_TRUE(client.heartbeat().is_error());

    ASSERT_TRUE(client.connect().is_ok());
    ASSERT_TRUE(client.handshake().is_ok());
    EXPECT_TRUE(client.heartbeat().is_ok());
    EXPECT_TRUE(client.is_connected());
}

TEST_F(SyncClientTest, RejectedTokenIsReported) {
    client_ = std::make_unique<client::SyncClient>(client_config("syncmd_bogus"));

    auto outcome = client_->sync_once();
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Network);
    EXPECT_NE(outcome.error().message.find("Handshake rejected"), std::string::npos);
    EXPECT_FALSE(client_->is_connected());
}

TEST_F(SyncClientTest, ReconnectsAfterClose) {
    auto& client = make_client();
    ASSERT_TRUE(client.sync_once().is_ok());
    client.close();
    EXPECT_FALSE(client.is_connected());

    write_file(client_root_ / "later.md", "later");
    ASSERT_TRUE(client.sync_once().is_ok());
    EXPECT_EQ(read_file(server_root_ / "later.md"), "later");
}

TEST_F(SyncClientTest, ChangeNotificationsAreFilteredAndDebounced) {
    auto& client = make_client();

    auto ineligible = client.notify_change({client::ChangeKind::Modified, "build/output.exe", ""});
    ASSERT_TRUE(ineligible.is_ok());
    EXPECT_EQ(ineligible.value(), client::SyncOutcome::Skipped);

    auto hidden = client.notify_change({client::ChangeKind::Created, ".git/config.md", ""});
    ASSERT_TRUE(hidden.is_ok());
    EXPECT_EQ(hidden.value(), client::SyncOutcome::Skipped);

    auto outside = client.notify_change({client::ChangeKind::Created, "/somewhere/else/notes.md", ""});
    ASSERT_TRUE(outside.is_ok());
    EXPECT_EQ(outside.value(), client::SyncOutcome::Skipped);
    EXPECT_FALSE(client.is_connected());

    write_file(client_root_ / "note.md", "v1");
    auto first = client.notify_change({client::ChangeKind::Created, (client_root_ / "note.md").string(), ""});
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value(), client::SyncOutcome::Completed);
    EXPECT_EQ(read_file(server_root_ / "note.md"), "v1");

    auto repeat = client.notify_change({client::ChangeKind::Modified, "note.md", ""});
    ASSERT_TRUE(repeat.is_ok());
    EXPECT_EQ(repeat.value(), client::SyncOutcome::Skipped);
}

TEST_F(SyncClientTest, ContentForAnotherPathIsRefused) {
    namespace asio = boost::asio;
    using asio::ip::tcp;

    // A responder that announces one file and then streams a different one.
    const auto rogue_root = create_temp_dir("syncmd_client_rogue");
    write_file(rogue_root / "announced.md", "announced");
    write_file(rogue_root / "overwrite.md", "unexpected");

    asio::io_context io_context;
    tcp::acceptor acceptor(io_context, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    Result<std::string> rogue_sent = Err<std::string>(ErrorKind::Network, "not run");

    std::thread rogue([&] {
        tcp::socket socket(io_context);
        acceptor.accept(socket);
        network::TcpStream stream(std::move(socket));
        protocol::EnvelopeChannel channel(stream);

        if (channel.receive().is_error() ||
            channel.send(protocol::HandshakeResponse{true, "rogue", "laptop", "ok"}).is_error() ||
            channel.receive().is_error()) {
            return;
        }

        sync::SnapshotIndexer indexer("rogue", rogue_root);
        auto announced = indexer.build_record("announced.md");
        auto streamed = indexer.build_record("overwrite.md");
        if (announced.is_error() || streamed.is_error()) {
            return;
        }
        protocol::SyncResponse response;
        response.operations.emplace_back(sync::AddOp{announced.value()});
        if (channel.send(response).is_error()) {
            return;
        }

        transfer::TransferSender sender(channel);
        rogue_sent = sender.send_file(rogue_root / "overwrite.md", streamed.value());
    });

    auto config = client_config(token_);
    config.peer_port = acceptor.local_endpoint().port();
    client_ = std::make_unique<client::SyncClient>(config);

    auto outcome = client_->sync_once();
    rogue.join();

    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Protocol);
    EXPECT_FALSE(client_->is_connected());
    ASSERT_TRUE(rogue_sent.is_error());
    EXPECT_EQ(rogue_sent.error().kind, ErrorKind::Protocol);

    EXPECT_FALSE(fs::exists(client_root_ / "overwrite.md"));
    EXPECT_FALSE(fs::exists(client_root_ / "overwrite.md.tmp"));
    EXPECT_FALSE(fs::exists(client_root_ / "announced.md"));

    remove_tree(rogue_root);
}
