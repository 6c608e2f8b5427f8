#include <gtest/gtest.h>

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <cstdio>
#include <cstring>
#include <fstream>

#include "ipc/payload.hpp"
#include "ipc/protocol.hpp"
#include "ipc/socket_server.hpp"

using namespace dockbox::ipc;

TEST(Protocol, HeaderLayout)
{
    Message msg(42, Opcode::INIT_ENV, std::string("{\"image\":\"alpine\"}"));
    auto wire = msg.serialize();

    ASSERT_EQ(wire.size(), HEADER_SIZE + 18);
    // Magic, little endian "XBKD"
    EXPECT_EQ(wire[0], 0x58);
    EXPECT_EQ(wire[3], 0x44);
    EXPECT_EQ(wire[4], 42);
    EXPECT_EQ(wire[8], 0x01);
    EXPECT_EQ(wire[9], 18);

    auto size = Message::get_message_size(wire.data(), wire.size());
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, wire.size());

    auto decoded = Message::deserialize(wire.data(), wire.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->client_id, 42u);
    EXPECT_EQ(decoded->opcode, Opcode::INIT_ENV);
    EXPECT_EQ(decoded->payload_str(), "{\"image\":\"alpine\"}");
}

TEST(Protocol, IncompleteOrInvalidHeaders)
{
    auto wire = Message(1, Opcode::NOOP, std::string("ping")).serialize();

    EXPECT_FALSE(Message::get_message_size(wire.data(), HEADER_SIZE - 1).has_value());
    EXPECT_FALSE(Message::deserialize(wire.data(), wire.size() - 1).has_value());

    wire[0] ^= 0xFF;
    EXPECT_FALSE(Message::get_message_size(wire.data(), wire.size()).has_value());
}

TEST(Protocol, OversizedPayloadRejected)
{
    MessageHeader header;
    header.magic = MAGIC_BYTES;
    header.client_id = 1;
    header.opcode = Opcode::INIT_ENV;
    header.payload_size = MAX_PAYLOAD_SIZE + 1;

    uint8_t raw[HEADER_SIZE];
    std::memcpy(raw, &header, HEADER_SIZE);
    EXPECT_FALSE(Message::get_message_size(raw, sizeof(raw)).has_value());
}

TEST(Protocol, OpcodeNames)
{
    EXPECT_STREQ(opcode_to_string(Opcode::INIT_ENV), "INIT_ENV");
    EXPECT_STREQ(opcode_to_string(Opcode::GET_AUDIT_LOG), "GET_AUDIT_LOG");
    EXPECT_STREQ(opcode_to_string(static_cast<Opcode>(0x42)), "UNKNOWN");
}

TEST(Payload, LenientDumpReplacesInvalidUtf8)
{
    nlohmann::json j;
    j["error"] = std::string("bad \xff byte");

    EXPECT_EQ(dump_payload(j), "{\"error\":\"bad \xEF\xBF\xBD byte\"}");
}

TEST(Payload, StrictDumpRejectsInvalidUtf8)
{
    nlohmann::json j;
    j["image"] = std::string("alpine\xff");

    std::string error;
    EXPECT_FALSE(try_dump_payload(j, error).has_value());
    EXPECT_NE(error.find("invalid UTF-8"), std::string::npos);

    j["image"] = "alpine:3.20";
    auto payload = try_dump_payload(j, error);
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(*payload, "{\"image\":\"alpine:3.20\"}");
}

namespace {

std::string test_socket_path(const char* name)
{
    return "/tmp/dockbox-test-" + std::to_string(getpid()) + "-" + name + ".sock";
}

int connect_client(const std::string& path)
{
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return -1;
    }
    return fd;
}

} // namespace

TEST(SocketServer, RequestResponseRoundTrip)
{
    std::string path = test_socket_path("roundtrip");
    SocketServer server(path);
    server.set_handler([](const Message& msg) {
        return Message(msg.client_id, msg.opcode, "echo:" + msg.payload_str());
    });
    ASSERT_TRUE(server.init());

    struct stat st;
    ASSERT_EQ(stat(path.c_str(), &st), 0);
    EXPECT_TRUE(S_ISSOCK(st.st_mode));
    EXPECT_EQ(st.st_mode & 0777, 0600u);

    int client = connect_client(path);
    ASSERT_GE(client, 0);

    int server_side = server.accept_connection();
    ASSERT_GE(server_side, 0);
    EXPECT_EQ(server.client_count(), 1u);

    // The client id is assigned by the server whatever the client sends
    auto request = Message(999, Opcode::NOOP, std::string("hello")).serialize();
    ASSERT_EQ(write(client, request.data(), request.size()), static_cast<ssize_t>(request.size()));

    ASSERT_TRUE(server.handle_client(server_side));
    EXPECT_TRUE(server.client_wants_write(server_side));
    ASSERT_TRUE(server.flush_client(server_side));
    EXPECT_FALSE(server.client_wants_write(server_side));

    std::vector<uint8_t> buffer(256);
    ssize_t n = read(client, buffer.data(), buffer.size());
    ASSERT_GT(n, 0);
    auto response = Message::deserialize(buffer.data(), static_cast<size_t>(n));
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->client_id, 1u);
    EXPECT_EQ(response->payload_str(), "echo:hello");

    close(client);
    server.stop();
    EXPECT_NE(stat(path.c_str(), &st), 0);
}

TEST(SocketServer, InvalidHeaderDropsClient)
{
    std::string path = test_socket_path("badmagic");
    SocketServer server(path);
    server.set_handler([](const Message& msg) { return msg; });
    ASSERT_TRUE(server.init());

    int client = connect_client(path);
    ASSERT_GE(client, 0);
    int server_side = server.accept_connection();
    ASSERT_GE(server_side, 0);

    std::vector<uint8_t> garbage(HEADER_SIZE, 0xAB);
    ASSERT_EQ(write(client, garbage.data(), garbage.size()), static_cast<ssize_t>(garbage.size()));

    EXPECT_FALSE(server.handle_client(server_side));

    server.remove_client(server_side);
    close(client);
}

TEST(SocketServer, RefusesToReplaceRegularFile)
{
    std::string path = test_socket_path("regular");
    {
        std::ofstream file(path);
        file << "not a socket";
    }

    SocketServer server(path);
    EXPECT_FALSE(server.init());

    std::remove(path.c_str());
}
