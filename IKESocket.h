#pragma once
#include "common.h"
#include "IKEHeader.h"
#include <map>
#include <mutex>
#include <vector>
#include <netinet/in.h>

// Session side of the demultiplexer. ike_packet starts at the IKE header; the
// Non-ESP marker has already been removed.
class IkePacketReceiver {
public:
    virtual ~IkePacketReceiver() = default;
    virtual void receiveIkePacket(const IKEHeader& header, const std::vector<uint8_t>& ike_packet) = 0;
};

class IKESocketRegistry;

// UDP-encapsulated IKE socket (port 4500). Every datagram starts with the
// four zero byte Non-ESP marker, followed by the IKE message. Inbound packets
// are routed by the local IKE SPI to the registered session.
class IKESocket {
private:
    friend class IKESocketRegistry;

    IKESocketRegistry& registry;
    int socket_fd;
    int reference_count;

    std::mutex spi_mutex;
    std::map<uint64_t, IkePacketReceiver*> spi_to_receiver;

    std::vector<uint8_t> receive_buffer;

    IKESocket(IKESocketRegistry& owner, int fd);

    bool handlePacket(const uint8_t* data, size_t length);

public:
    static constexpr size_t RECEIVE_BUFFER_SIZE = 65536;

    ~IKESocket();

    // Creates a UDP socket bound to local_ip:port. Returns -1 on failure.
    static int openUdpEncapSocket(const std::string& local_ip = "0.0.0.0",
                                  uint16_t port = UDP_ENCAP_PORT);

    IKESocket(const IKESocket&) = delete;
    IKESocket& operator=(const IKESocket&) = delete;

    int getFd() const { return socket_fd; }

    // Replaces any receiver already registered for spi
    void registerIke(uint64_t spi, IkePacketReceiver* receiver);
    void unregisterIke(uint64_t spi);

    // Prepends the Non-ESP marker and sends to dest
    bool sendIkePacket(const std::vector<uint8_t>& ike_packet, const sockaddr_in& dest);

    // Reads until the socket would block. Returns the number of packets a
    // session accepted; exceptions thrown by a session are logged and the
    // drain continues. A session may call releaseReference() from its
    // callback.
    size_t handlePacketsIn();

    // Waits up to timeout_ms for the socket to become readable
    bool waitForPackets(int timeout_ms);

    // Drops one reference; the last one closes the socket and destroys this
    // object.
    void releaseReference();
    int getReferenceCount() const;
};

class IKESocketRegistry {
private:
    friend class IKESocket;

    mutable std::mutex registry_mutex;
    std::map<int, std::unique_ptr<IKESocket>> sockets;

    void release(IKESocket* socket);

public:
    IKESocketRegistry() = default;
    IKESocketRegistry(const IKESocketRegistry&) = delete;
    IKESocketRegistry& operator=(const IKESocketRegistry&) = delete;

    // Returns the socket wrapping fd with one more reference, creating it on
    // first use. The registry takes ownership of fd. Returns nullptr if the
    // descriptor cannot be made non-blocking.
    IKESocket* getIkeSocket(int fd);

    size_t size() const;
};
