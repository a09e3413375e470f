#include "IKESocket.h"
#include <cerrno>
#include <cstring>
#include <optional>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>

namespace {
const uint8_t NON_ESP_MARKER[NON_ESP_MARKER_LENGTH] = {0, 0, 0, 0};

std::string describe(const sockaddr_in& addr) {
    char addr_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr.sin_addr, addr_str, sizeof(addr_str));
    return std::string(addr_str) + ":" + std::to_string(ntohs(addr.sin_port));
}
}

IKESocket::IKESocket(IKESocketRegistry& owner, int fd)
    : registry(owner), socket_fd(fd), reference_count(0), receive_buffer(RECEIVE_BUFFER_SIZE) {}

IKESocket::~IKESocket() {
    if (socket_fd >= 0) {
        close(socket_fd);
        std::cout << "[IKESocket] Closed socket " << socket_fd << std::endl;
    }
}

int IKESocket::openUdpEncapSocket(const std::string& local_ip, uint16_t port) {
    sockaddr_in local_addr;
    memset(&local_addr, 0, sizeof(local_addr));
    local_addr.sin_family = AF_INET;
    local_addr.sin_port = htons(port);
    if (inet_pton(AF_INET, local_ip.c_str(), &local_addr.sin_addr) != 1) {
        std::cerr << "[IKESocket] Invalid local address: " << local_ip << std::endl;
        return -1;
    }

    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        std::cerr << "[IKESocket] Failed to create socket: " << strerror(errno) << std::endl;
        return -1;
    }

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "[IKESocket] Failed to set SO_REUSEADDR" << std::endl;
        close(fd);
        return -1;
    }

    if (bind(fd, (struct sockaddr*)&local_addr, sizeof(local_addr)) < 0) {
        std::cerr << "[IKESocket] Failed to bind socket to " << describe(local_addr) << ": "
                  << strerror(errno) << std::endl;
        close(fd);
        return -1;
    }

    std::cout << "[IKESocket] Socket bound to " << describe(local_addr) << std::endl;
    return fd;
}

void IKESocket::registerIke(uint64_t spi, IkePacketReceiver* receiver) {
    std::lock_guard<std::mutex> lock(spi_mutex);
    spi_to_receiver[spi] = receiver;
}

void IKESocket::unregisterIke(uint64_t spi) {
    std::lock_guard<std::mutex> lock(spi_mutex);
    spi_to_receiver.erase(spi);
}

bool IKESocket::sendIkePacket(const std::vector<uint8_t>& ike_packet, const sockaddr_in& dest) {
    std::vector<uint8_t> datagram(NON_ESP_MARKER, NON_ESP_MARKER + NON_ESP_MARKER_LENGTH);
    appendBytes(datagram, ike_packet);

    ssize_t bytes_sent = sendto(socket_fd, datagram.data(), datagram.size(), 0,
                                (const struct sockaddr*)&dest, sizeof(dest));
    if (bytes_sent < 0) {
        std::cerr << "[IKESocket] Failed to send to " << describe(dest) << ": "
                  << strerror(errno) << std::endl;
        return false;
    }
    if (static_cast<size_t>(bytes_sent) != datagram.size()) {
        std::cerr << "[IKESocket] Partial send: " << bytes_sent << " of " << datagram.size()
                  << " bytes" << std::endl;
        return false;
    }
    return true;
}

bool IKESocket::handlePacket(const uint8_t* data, size_t length) {
    if (length < NON_ESP_MARKER_LENGTH
        || memcmp(data, NON_ESP_MARKER, NON_ESP_MARKER_LENGTH) != 0) {
        std::cerr << "[IKESocket] Dropping packet without Non-ESP marker (" << length
                  << " bytes)" << std::endl;
        return false;
    }

    const uint8_t* ike_data = data + NON_ESP_MARKER_LENGTH;
    size_t ike_length = length - NON_ESP_MARKER_LENGTH;

    std::optional<IKEHeader> header;
    try {
        header.emplace(IKEHeader::decode(ike_data, ike_length));
    } catch (const IkeException& e) {
        std::cerr << "[IKESocket] Dropping packet with invalid IKE header: " << e.what()
                  << std::endl;
        return false;
    }

    uint64_t local_spi = header->fromIkeInitiator() ? header->getResponderSPI()
                                                    : header->getInitiatorSPI();
    IkePacketReceiver* receiver = nullptr;
    {
        std::lock_guard<std::mutex> lock(spi_mutex);
        auto it = spi_to_receiver.find(local_spi);
        if (it != spi_to_receiver.end()) {
            receiver = it->second;
        }
    }

    if (receiver == nullptr) {
        std::cerr << "[IKESocket] No IKE session for SPI 0x" << std::hex << local_spi
                  << std::dec << ", dropping packet" << std::endl;
        return false;
    }

    try {
        receiver->receiveIkePacket(*header, std::vector<uint8_t>(ike_data, ike_data + ike_length));
    } catch (const std::exception& e) {
        std::cerr << "[IKESocket] IKE session for SPI 0x" << std::hex << local_spi << std::dec
                  << " failed to handle packet: " << e.what() << std::endl;
        return false;
    }
    return true;
}

size_t IKESocket::handlePacketsIn() {
    // A session may release the last reference from its callback; hold one
    // for the drain so the socket outlives the loop.
    {
        std::lock_guard<std::mutex> lock(registry.registry_mutex);
        reference_count++;
    }

    size_t delivered = 0;
    while (true) {
        ssize_t bytes_received = recvfrom(socket_fd, receive_buffer.data(), receive_buffer.size(),
                                          0, nullptr, nullptr);
        if (bytes_received < 0) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                std::cerr << "[IKESocket] Failed to receive: " << strerror(errno) << std::endl;
            }
            break;
        }
        if (handlePacket(receive_buffer.data(), static_cast<size_t>(bytes_received))) {
            delivered++;
        }
    }

    // May destroy this socket
    releaseReference();
    return delivered;
}

bool IKESocket::waitForPackets(int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = socket_fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int poll_result = poll(&pfd, 1, timeout_ms);
    if (poll_result < 0) {
        std::cerr << "[IKESocket] Poll error: " << strerror(errno) << std::endl;
        return false;
    }
    return poll_result > 0 && (pfd.revents & POLLIN) != 0;
}

void IKESocket::releaseReference() {
    registry.release(this);
}

int IKESocket::getReferenceCount() const {
    std::lock_guard<std::mutex> lock(registry.registry_mutex);
    return reference_count;
}

IKESocket* IKESocketRegistry::getIkeSocket(int fd) {
    std::lock_guard<std::mutex> lock(registry_mutex);

    auto it = sockets.find(fd);
    if (it != sockets.end()) {
        it->second->reference_count++;
        return it->second.get();
    }

    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        std::cerr << "[IKESocket] Failed to set socket " << fd << " non-blocking: "
                  << strerror(errno) << std::endl;
        return nullptr;
    }

    std::unique_ptr<IKESocket> socket(new IKESocket(*this, fd));
    socket->reference_count = 1;
    IKESocket* raw = socket.get();
    sockets[fd] = std::move(socket);
    return raw;
}

void IKESocketRegistry::release(IKESocket* socket) {
    std::lock_guard<std::mutex> lock(registry_mutex);

    auto it = sockets.find(socket->socket_fd);
    if (it == sockets.end() || it->second.get() != socket) {
        throw std::logic_error("Releasing a socket the registry does not own");
    }
    if (--socket->reference_count == 0) {
        sockets.erase(it);
    }
}

size_t IKESocketRegistry::size() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return sockets.size();
}
