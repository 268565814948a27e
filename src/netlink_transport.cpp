#include "netlink_transport.hpp"
#include <netlink/netlink.h>
#include <netlink/socket.h>
#include <netlink/genl/genl.h>
#include <netlink/genl/ctrl.h>
#include <linux/netlink.h>
#include <sys/socket.h>
#include <poll.h>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <iostream>

// Scan dumps of a busy band easily exceed the default 32k receive buffer.
static constexpr int NETLINK_RX_BUFFER_SIZE = 256 * 1024;

void NetlinkSocket::SockDeleter::operator()(struct nl_sock* sock) const {
    nl_socket_free(sock);
}

NetlinkSocket::NetlinkSocket() : sock_(nl_socket_alloc()) {
    if (!sock_) {
        throw TransportError("Failed to allocate netlink socket");
    }

    int err = genl_connect(sock_.get());
    if (err < 0) {
        throw TransportError(std::string("Failed to connect to generic netlink: ") + nl_geterror(err));
    }

    err = nl_socket_set_buffer_size(sock_.get(), NETLINK_RX_BUFFER_SIZE, 0);
    if (err < 0) {
        std::cerr << "Failed to set netlink buffer size: " << nl_geterror(err) << std::endl;
    }

    int enable = 1;
    if (setsockopt(fd(), SOL_NETLINK, NETLINK_EXT_ACK, &enable, sizeof(enable)) < 0) {
        std::cerr << "Kernel error messages unavailable: " << std::strerror(errno) << std::endl;
    }
}

NetlinkSocket::~NetlinkSocket() = default;

int NetlinkSocket::fd() const {
    return nl_socket_get_fd(sock_.get());
}

uint16_t NetlinkSocket::resolveFamily(const std::string& family) {
    int id = genl_ctrl_resolve(sock_.get(), family.c_str());
    if (id < 0) {
        throw TransportError("Failed to resolve " + family + " family: " + nl_geterror(id));
    }
    return static_cast<uint16_t>(id);
}

void NetlinkSocket::joinGroup(const std::string& family, const std::string& group) {
    int id = genl_ctrl_resolve_grp(sock_.get(), family.c_str(), group.c_str());
    if (id < 0) {
        throw TransportError("Failed to resolve " + family + " multicast group '" + group + "': " +
                             nl_geterror(id));
    }

    int err = nl_socket_add_membership(sock_.get(), id);
    if (err < 0) {
        throw TransportError("Failed to join multicast group '" + group + "': " + nl_geterror(err));
    }
}

// Called after the controller lookups, which rely on libnl's blocking
// request/ack handling.
void NetlinkSocket::setNonBlocking() {
    nl_socket_disable_auto_ack(sock_.get());
    nl_socket_enable_msg_peek(sock_.get());

    int err = nl_socket_set_nonblocking(sock_.get());
    if (err < 0) {
        throw TransportError(std::string("Failed to make netlink socket non-blocking: ") + nl_geterror(err));
    }
}

void NetlinkSocket::send(const NetlinkRequest& request) {
    int err = nl_send_auto(sock_.get(), request.get());
    if (err < 0) {
        throw TransportError(std::string("Failed to send netlink message: ") + nl_geterror(err));
    }
}

bool NetlinkSocket::receiveBatch(std::vector<NetlinkMessage>& batch, int timeoutMs) {
    using Clock = std::chrono::steady_clock;
    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeoutMs < 0 ? 0 : timeoutMs);

    batch.clear();
    for (;;) {
        int wait = -1;
        if (timeoutMs >= 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining.count() < 0) {
                return false;
            }
            wait = static_cast<int>(remaining.count());
        }

        struct pollfd pfd = { fd(), POLLIN, 0 };
        int ready = poll(&pfd, 1, wait);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("Failed to poll netlink socket: ") + std::strerror(errno));
        }
        if (ready == 0) {
            return false;
        }

        struct sockaddr_nl peer;
        unsigned char* buffer = nullptr;
        int received = nl_recv(sock_.get(), &peer, &buffer, nullptr);
        std::unique_ptr<unsigned char, decltype(&std::free)> guard(buffer, &std::free);

        if (received < 0) {
            throw TransportError(std::string("Failed to receive netlink message: ") + nl_geterror(received));
        }
        if (received == 0) {
            // Woken up without a datagram to read.
            continue;
        }

        batch = NetlinkMessage::decodeBatch(buffer, static_cast<size_t>(received));
        if (!batch.empty()) {
            return true;
        }
    }
}

void receiveAck(NetlinkTransport& transport, int timeoutMs) {
    std::vector<NetlinkMessage> batch;

    for (;;) {
        if (!transport.receiveBatch(batch, timeoutMs)) {
            throw TransportError("Timed out waiting for netlink acknowledgement");
        }

        for (const NetlinkMessage& msg : batch) {
            if (msg.kind == NetlinkMessage::Kind::Ack) {
                return;
            }
            if (msg.kind == NetlinkMessage::Kind::Error) {
                throw ProtocolError(kernelErrorText(msg), msg.error);
            }
        }
    }
}

ControlChannel LibnlTransportFactory::openControl() {
    auto socket = std::make_unique<NetlinkSocket>();
    ControlChannel channel;
    channel.familyId = socket->resolveFamily(NL80211_FAMILY_NAME);
    socket->setNonBlocking();
    channel.transport = std::move(socket);
    return channel;
}

std::unique_ptr<NetlinkTransport> LibnlTransportFactory::openEventChannel(const std::string& family,
                                                                          const std::string& group) {
    auto socket = std::make_unique<NetlinkSocket>();
    socket->joinGroup(family, group);
    socket->setNonBlocking();
    return socket;
}
