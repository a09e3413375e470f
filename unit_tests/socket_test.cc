/*
 * socket_test.cc
 *
 * demultiplexing of UDP-encapsulated IKE packets over loopback sockets
 */

#include "test_helpers.hpp"
#include "IKESocket.h"
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <sys/socket.h>

namespace {
class RecordingReceiver : public IkePacketReceiver {
public:
    std::vector<IKEHeader> headers;
    std::vector<std::vector<uint8_t>> packets;

    void receiveIkePacket(const IKEHeader& header, const std::vector<uint8_t>& ike_packet) override {
        headers.push_back(header);
        packets.push_back(ike_packet);
    }
};

// Tears its session down on the first packet
class ClosingReceiver : public IkePacketReceiver {
public:
    IKESocket* ike_socket = nullptr;
    uint64_t spi = 0;
    int calls = 0;

    void receiveIkePacket(const IKEHeader&, const std::vector<uint8_t>&) override {
        calls++;
        ike_socket->unregisterIke(spi);
        ike_socket->releaseReference();
    }
};

class FailingReceiver : public IkePacketReceiver {
public:
    int calls = 0;

    void receiveIkePacket(const IKEHeader&, const std::vector<uint8_t>&) override {
        calls++;
        throw IkeSyntaxException("Truncated payload");
    }
};

int openLoopbackSocket(sockaddr_in& bound_addr) {
    int fd = IKESocket::openUdpEncapSocket("127.0.0.1", 0);
    REQUIRE(fd >= 0);

    socklen_t len = sizeof(bound_addr);
    REQUIRE(getsockname(fd, (struct sockaddr*)&bound_addr, &len) == 0);
    return fd;
}

bool isOpen(int fd) {
    return fcntl(fd, F_GETFD) != -1 || errno != EBADF;
}

// Header-only IKE message
std::vector<uint8_t> ikePacket(uint64_t ispi, uint64_t rspi, bool from_initiator) {
    IKEHeader header(ispi, rspi, PayloadType::NO_NEXT_PAYLOAD, IKEMessageType::INFORMATIONAL,
                     false, from_initiator, 3);
    std::vector<uint8_t> packet;
    header.encode(0, packet);
    return packet;
}

void sendRaw(int fd, const std::vector<uint8_t>& datagram, const sockaddr_in& dest) {
    ssize_t sent = sendto(fd, datagram.data(), datagram.size(), 0,
                          (const struct sockaddr*)&dest, sizeof(dest));
    REQUIRE(sent == static_cast<ssize_t>(datagram.size()));
}

std::vector<uint8_t> withMarker(const std::vector<uint8_t>& ike_packet) {
    std::vector<uint8_t> datagram(NON_ESP_MARKER_LENGTH, 0);
    appendBytes(datagram, ike_packet);
    return datagram;
}

// Loopback socket owned by a registry plus a plain socket to send from
struct SocketPair {
    IKESocketRegistry registry;
    sockaddr_in local_addr{};
    sockaddr_in peer_addr{};
    IKESocket* ike_socket = nullptr;
    int peer_fd = -1;

    SocketPair() {
        ike_socket = registry.getIkeSocket(openLoopbackSocket(local_addr));
        REQUIRE(ike_socket != nullptr);
        peer_fd = openLoopbackSocket(peer_addr);
    }

    ~SocketPair() {
        close(peer_fd);
    }

    size_t deliver(const std::vector<uint8_t>& datagram) {
        sendRaw(peer_fd, datagram, local_addr);
        REQUIRE(ike_socket->waitForPackets(1000));
        return ike_socket->handlePacketsIn();
    }
};
}

TEST_CASE("registry reference counting") {
    IKESocketRegistry registry;
    sockaddr_in addr{};
    int fd = openLoopbackSocket(addr);

    IKESocket* first = registry.getIkeSocket(fd);
    REQUIRE(first != nullptr);
    CHECK(first->getReferenceCount() == 1);
    CHECK((fcntl(fd, F_GETFL) & O_NONBLOCK) != 0);

    IKESocket* second = registry.getIkeSocket(fd);
    CHECK(second == first);
    CHECK(first->getReferenceCount() == 2);
    CHECK(registry.size() == 1);

    first->releaseReference();
    CHECK(second->getReferenceCount() == 1);
    CHECK(isOpen(fd));

    second->releaseReference();
    CHECK(registry.size() == 0);
    CHECK_FALSE(isOpen(fd));
}

TEST_CASE("routing by local SPI") {
    SocketPair pair;
    RecordingReceiver session;
    pair.ike_socket->registerIke(0x1122, &session);

    SECTION("packet from the initiator uses the responder SPI") {
        std::vector<uint8_t> packet = ikePacket(0x9999, 0x1122, true);
        CHECK(pair.deliver(withMarker(packet)) == 1);
        REQUIRE(session.packets.size() == 1);
        CHECK(session.packets[0] == packet);
        CHECK(session.headers[0].getResponderSPI() == 0x1122);
    }

    SECTION("packet from the responder uses the initiator SPI") {
        CHECK(pair.deliver(withMarker(ikePacket(0x1122, 0x9999, false))) == 1);
        CHECK(session.packets.size() == 1);
    }

    SECTION("SPI of the remote side is not routed") {
        CHECK(pair.deliver(withMarker(ikePacket(0x1122, 0x9999, true))) == 0);
        CHECK(session.packets.empty());
    }

    pair.ike_socket->releaseReference();
}

TEST_CASE("last registration wins") {
    SocketPair pair;
    RecordingReceiver old_session;
    RecordingReceiver new_session;

    pair.ike_socket->registerIke(0x1122, &old_session);
    pair.ike_socket->registerIke(0x1122, &new_session);
    CHECK(pair.deliver(withMarker(ikePacket(0x9999, 0x1122, true))) == 1);
    CHECK(old_session.packets.empty());
    CHECK(new_session.packets.size() == 1);

    pair.ike_socket->unregisterIke(0x1122);
    CHECK(pair.deliver(withMarker(ikePacket(0x9999, 0x1122, true))) == 0);
    CHECK(new_session.packets.size() == 1);

    pair.ike_socket->releaseReference();
}

TEST_CASE("packets dropped before routing") {
    SocketPair pair;
    RecordingReceiver session;
    pair.ike_socket->registerIke(0x1122, &session);

    SECTION("non-zero marker") {
        std::vector<uint8_t> datagram = withMarker(ikePacket(0x9999, 0x1122, true));
        datagram[3] = 0x01;
        CHECK(pair.deliver(datagram) == 0);
    }

    SECTION("shorter than the marker") {
        CHECK(pair.deliver({0, 0}) == 0);
    }

    SECTION("truncated IKE header") {
        std::vector<uint8_t> packet = ikePacket(0x9999, 0x1122, true);
        packet.resize(20);
        CHECK(pair.deliver(withMarker(packet)) == 0);
    }

    SECTION("several datagrams in one drain") {
        sendRaw(pair.peer_fd, withMarker(ikePacket(0x9999, 0x1122, true)), pair.local_addr);
        sendRaw(pair.peer_fd, {1, 2, 3, 4, 5}, pair.local_addr);
        CHECK(pair.deliver(withMarker(ikePacket(0x9999, 0x1122, true))) == 2);
    }

    pair.ike_socket->releaseReference();
}

TEST_CASE("send prepends the Non-ESP marker") {
    SocketPair sender;
    SocketPair receiver;
    RecordingReceiver session;
    receiver.ike_socket->registerIke(0x4242, &session);

    std::vector<uint8_t> packet = ikePacket(0x4242, 0x0707, false);
    REQUIRE(sender.ike_socket->sendIkePacket(packet, receiver.local_addr));

    REQUIRE(receiver.ike_socket->waitForPackets(1000));
    CHECK(receiver.ike_socket->handlePacketsIn() == 1);
    REQUIRE(session.packets.size() == 1);
    CHECK(session.packets[0] == packet);

    CHECK_FALSE(receiver.ike_socket->waitForPackets(0));

    sender.ike_socket->releaseReference();
    receiver.ike_socket->releaseReference();
}

TEST_CASE("session releases the socket from its callback") {
    IKESocketRegistry registry;
    sockaddr_in local_addr{};
    sockaddr_in peer_addr{};
    int fd = openLoopbackSocket(local_addr);
    int peer_fd = openLoopbackSocket(peer_addr);

    IKESocket* ike_socket = registry.getIkeSocket(fd);
    REQUIRE(ike_socket != nullptr);
    ClosingReceiver session;
    session.ike_socket = ike_socket;
    session.spi = 0x1122;
    ike_socket->registerIke(0x1122, &session);

    sendRaw(peer_fd, withMarker(ikePacket(0x9999, 0x1122, true)), local_addr);
    sendRaw(peer_fd, withMarker(ikePacket(0x9999, 0x1122, true)), local_addr);
    REQUIRE(ike_socket->waitForPackets(1000));

    CHECK(ike_socket->handlePacketsIn() == 1);
    CHECK(session.calls == 1);
    CHECK(registry.size() == 0);
    CHECK_FALSE(isOpen(fd));

    close(peer_fd);
}

TEST_CASE("session failures do not stop the drain") {
    SocketPair pair;
    FailingReceiver failing;
    RecordingReceiver session;
    pair.ike_socket->registerIke(0x1122, &failing);
    pair.ike_socket->registerIke(0x3344, &session);

    sendRaw(pair.peer_fd, withMarker(ikePacket(0x9999, 0x1122, true)), pair.local_addr);
    sendRaw(pair.peer_fd, withMarker(ikePacket(0x9999, 0x1122, true)), pair.local_addr);
    sendRaw(pair.peer_fd, withMarker(ikePacket(0x9999, 0x3344, true)), pair.local_addr);
    CHECK_NOTHROW(pair.deliver(withMarker(ikePacket(0x9999, 0x1122, true))));
    CHECK(failing.calls == 3);
    CHECK(session.packets.size() == 1);
    CHECK(pair.ike_socket->getReferenceCount() == 1);

    pair.ike_socket->releaseReference();
}
