#pragma once
#include "netlink_message.hpp"
#include "scan_error.hpp"
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct nl_sock;

constexpr const char* NL80211_FAMILY_NAME = "nl80211";
constexpr const char* NL80211_SCAN_GROUP_NAME = "scan";

class NetlinkTransport {
public:
    virtual ~NetlinkTransport() = default;

    virtual void send(const NetlinkRequest& request) = 0;

    // Reads one datagram worth of messages. Waits at most timeoutMs
    // (negative waits forever) and returns false if nothing arrived.
    virtual bool receiveBatch(std::vector<NetlinkMessage>& batch, int timeoutMs) = 0;
};

struct ControlChannel {
    std::unique_ptr<NetlinkTransport> transport;
    uint16_t familyId = 0;
};

class NetlinkTransportFactory {
public:
    virtual ~NetlinkTransportFactory() = default;

    // Connects to generic netlink and resolves the nl80211 family id.
    virtual ControlChannel openControl() = 0;

    // Second socket subscribed to the given multicast group of the family.
    virtual std::unique_ptr<NetlinkTransport> openEventChannel(const std::string& family,
                                                               const std::string& group) = 0;
};

// libnl backed generic netlink socket. Requests carry their own flags, so
// automatic acks are turned off once the socket is set up.
class NetlinkSocket : public NetlinkTransport {
public:
    NetlinkSocket();
    ~NetlinkSocket() override;

    int fd() const;
    uint16_t resolveFamily(const std::string& family);
    void joinGroup(const std::string& family, const std::string& group);
    void setNonBlocking();

    void send(const NetlinkRequest& request) override;
    bool receiveBatch(std::vector<NetlinkMessage>& batch, int timeoutMs) override;

private:
    struct SockDeleter {
        void operator()(struct nl_sock* sock) const;
    };

    std::unique_ptr<struct nl_sock, SockDeleter> sock_;
};

class LibnlTransportFactory : public NetlinkTransportFactory {
public:
    ControlChannel openControl() override;
    std::unique_ptr<NetlinkTransport> openEventChannel(const std::string& family,
                                                       const std::string& group) override;
};

inline std::string kernelErrorText(const NetlinkMessage& message) {
    if (!message.errorMessage.empty()) {
        return message.errorMessage;
    }
    return std::strerror(-message.error);
}

// Drains a dump until the DONE sentinel; a DONE carrying an errno fails the
// dump. Every data message goes through extract; empty results are skipped.
// Batches queued after DONE are left unread.
template <typename T, typename Extract>
std::vector<T> receiveAll(NetlinkTransport& transport, Extract extract, int timeoutMs) {
    std::vector<T> items;
    std::vector<NetlinkMessage> batch;

    for (;;) {
        if (!transport.receiveBatch(batch, timeoutMs)) {
            throw TransportError("Timed out waiting for netlink dump response");
        }

        for (const NetlinkMessage& msg : batch) {
            switch (msg.kind) {
            case NetlinkMessage::Kind::Done:
                if (msg.error < 0) {
                    throw ProtocolError(kernelErrorText(msg), msg.error);
                }
                return items;
            case NetlinkMessage::Kind::Error:
                throw ProtocolError(kernelErrorText(msg), msg.error);
            case NetlinkMessage::Kind::Ack:
                break;
            case NetlinkMessage::Kind::Data: {
                std::optional<T> item = extract(msg);
                if (item) {
                    items.push_back(std::move(*item));
                }
                break;
            }
            }
        }
    }
}

// Waits for the ack of a request sent with NLM_F_ACK.
void receiveAck(NetlinkTransport& transport, int timeoutMs);
