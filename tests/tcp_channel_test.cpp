#include <gtest/gtest.h>
#include <future>
#include <mutex>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/endian/conversion.hpp>
#include "network/network_error.hpp"
#include "network/tcp_channel.hpp"
#include "test_utils.hpp"

using namespace sft::network;
using boost::asio::ip::tcp;

class TCPChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_logging();
        acceptor = std::make_unique<tcp::acceptor>(io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        port = acceptor->local_endpoint().port();
    }

    void TearDown() override {
        if (server) server->close();
        if (client) client->close();
        acceptor.reset();
    }

    // Connects a client and accepts it on the server side
    void connect_pair(uint64_t max_frame_size = Codec::DEFAULT_MAX_FRAME_SIZE) {
        auto accepted = std::async(std::launch::async, [this, max_frame_size] {
            return TCP_Channel::accept(*acceptor, max_frame_size);
        });
        client = TCP_Channel::connect(io_context, "127.0.0.1", port, max_frame_size);
        server = accepted.get();
    }

    boost::asio::io_context io_context;
    std::unique_ptr<tcp::acceptor> acceptor;
    uint16_t port = 0;
    std::shared_ptr<TCP_Channel> client;
    std::shared_ptr<TCP_Channel> server;
};

TEST_F(TCPChannelTest, ConnectAndAccept) {
    connect_pair();
    EXPECT_TRUE(client->is_connected());
    EXPECT_TRUE(server->is_connected());
}

TEST_F(TCPChannelTest, ConnectFailureThrowsChannelError) {
    acceptor->close();
    EXPECT_THROW(TCP_Channel::connect(io_context, "127.0.0.1", port), ChannelError);
}

TEST_F(TCPChannelTest, FramesArriveInOrder) {
    connect_pair();

    std::mutex mutex;
    std::vector<Frame> received;
    auto subscription = server->subscribe([&](const Frame& frame) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(frame);
    });
    ASSERT_TRUE(server->start_reading());

    client->send(to_bytes("first"));
    client->send(Frame{});
    client->send(Frame(100000, 0x5A));

    ASSERT_TRUE(wait_for([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return received.size() == 3;
    }));

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(received[0], to_bytes("first"));
    EXPECT_TRUE(received[1].empty());
    EXPECT_EQ(received[2], Frame(100000, 0x5A));
}

TEST_F(TCPChannelTest, BothDirections) {
    connect_pair();

    std::promise<Frame> at_client;
    std::promise<Frame> at_server;
    auto c = client->subscribe([&](const Frame& frame) { at_client.set_value(frame); });
    auto s = server->subscribe([&](const Frame& frame) { at_server.set_value(frame); });
    ASSERT_TRUE(client->start_reading());
    ASSERT_TRUE(server->start_reading());

    client->send(to_bytes("ping"));
    server->send(to_bytes("pong"));

    auto server_future = at_server.get_future();
    auto client_future = at_client.get_future();
    ASSERT_EQ(server_future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    ASSERT_EQ(client_future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(server_future.get(), to_bytes("ping"));
    EXPECT_EQ(client_future.get(), to_bytes("pong"));
}

TEST_F(TCPChannelTest, SimultaneousTrafficInBothDirections) {
    constexpr int FRAME_COUNT = 200;
    connect_pair();
    sft::logger::init_logging("", boost::log::trivial::error);

    // Frame i carries its index in the first byte pair and is large enough
    // that sends block while the peer's reader is busy
    auto make_frame = [](int i) {
        Frame frame(16 * 1024 + i, static_cast<uint8_t>(i));
        frame[0] = static_cast<uint8_t>(i >> 8);
        frame[1] = static_cast<uint8_t>(i);
        return frame;
    };

    std::mutex mutex;
    std::vector<Frame> at_client;
    std::vector<Frame> at_server;
    auto c = client->subscribe([&](const Frame& frame) {
        std::lock_guard<std::mutex> lock(mutex);
        at_client.push_back(frame);
    });
    auto s = server->subscribe([&](const Frame& frame) {
        std::lock_guard<std::mutex> lock(mutex);
        at_server.push_back(frame);
    });
    ASSERT_TRUE(client->start_reading());
    ASSERT_TRUE(server->start_reading());

    auto client_writer = std::async(std::launch::async, [&] {
        for (int i = 0; i < FRAME_COUNT; ++i) client->send(make_frame(i));
    });
    auto server_writer = std::async(std::launch::async, [&] {
        for (int i = 0; i < FRAME_COUNT; ++i) server->send(make_frame(i));
    });
    EXPECT_NO_THROW(client_writer.get());
    EXPECT_NO_THROW(server_writer.get());

    bool complete = wait_for([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return at_client.size() == FRAME_COUNT && at_server.size() == FRAME_COUNT;
    }, std::chrono::milliseconds(10000));
    init_logging();
    ASSERT_TRUE(complete);

    std::lock_guard<std::mutex> lock(mutex);
    for (int i = 0; i < FRAME_COUNT; ++i) {
        EXPECT_EQ(at_server[i], make_frame(i)) << "frame " << i;
        EXPECT_EQ(at_client[i], make_frame(i)) << "frame " << i;
    }
    EXPECT_TRUE(client->is_connected());
    EXPECT_TRUE(server->is_connected());
}

TEST_F(TCPChannelTest, PeerCloseDisconnectsReader) {
    connect_pair();
    ASSERT_TRUE(server->start_reading());

    client->close();

    EXPECT_TRUE(wait_for([&] { return !server->is_connected(); }));
    EXPECT_FALSE(client->is_connected());
    EXPECT_THROW(client->send(to_bytes("late")), ChannelError);
}

TEST_F(TCPChannelTest, OversizedOutboundFrameRejected) {
    connect_pair(64);
    EXPECT_THROW(client->send(Frame(65, 0)), ChannelError);
    EXPECT_TRUE(client->is_connected());
}

TEST_F(TCPChannelTest, OversizedInboundFrameDropsConnection) {
    auto accepted = std::async(std::launch::async, [this] {
        return TCP_Channel::accept(*acceptor, 16);
    });
    tcp::socket raw(io_context);
    raw.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
    server = accepted.get();

    int calls = 0;
    auto subscription = server->subscribe([&](const Frame&) { ++calls; });
    ASSERT_TRUE(server->start_reading());

    uint64_t declared = boost::endian::native_to_big(uint64_t{1024});
    boost::asio::write(raw, boost::asio::buffer(&declared, sizeof(declared)));

    EXPECT_TRUE(wait_for([&] { return !server->is_connected(); }));
    EXPECT_EQ(calls, 0);
}

TEST_F(TCPChannelTest, HugeDeclaredSizeWithShortBodyDropsConnection) {
    auto accepted = std::async(std::launch::async, [this] {
        return TCP_Channel::accept(*acceptor);
    });
    tcp::socket raw(io_context);
    raw.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
    server = accepted.get();

    int calls = 0;
    auto subscription = server->subscribe([&](const Frame&) { ++calls; });
    ASSERT_TRUE(server->start_reading());

    // Within the frame limit, but only a few bytes ever follow
    uint64_t declared = boost::endian::native_to_big(uint64_t{1} << 31);
    boost::asio::write(raw, boost::asio::buffer(&declared, sizeof(declared)));
    boost::asio::write(raw, boost::asio::buffer("abc", 3));
    raw.close();

    EXPECT_TRUE(wait_for([&] { return !server->is_connected(); }));
    EXPECT_EQ(calls, 0);
}

TEST_F(TCPChannelTest, StartReadingOnClosedChannelFails) {
    connect_pair();
    server->close();
    EXPECT_FALSE(server->start_reading());
}
