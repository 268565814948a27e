#include "netlink_message.hpp"
#include "scan_error.hpp"
#include <linux/netlink.h>
#include <linux/genetlink.h>
#include <linux/nl80211.h>
#include <netlink/netlink.h>
#include <netlink/msg.h>
#include <netlink/attr.h>
#include <netlink/genl/genl.h>
#include <cstring>

NetlinkAttribute::NetlinkAttribute(uint16_t type, std::vector<uint8_t> payload)
    : type_(type), payload_(std::move(payload)) {}

template <typename T>
T NetlinkAttribute::readScalar(const char* typeName) const {
    if (payload_.size() != sizeof(T)) {
        throw DecodeError("Attribute " + std::to_string(type_) + " has " +
                          std::to_string(payload_.size()) + " bytes, expected " +
                          std::to_string(sizeof(T)) + " for " + typeName);
    }
    T value;
    std::memcpy(&value, payload_.data(), sizeof(T));
    return value;
}

uint8_t NetlinkAttribute::asU8() const { return readScalar<uint8_t>("u8"); }
uint16_t NetlinkAttribute::asU16() const { return readScalar<uint16_t>("u16"); }
uint32_t NetlinkAttribute::asU32() const { return readScalar<uint32_t>("u32"); }
uint64_t NetlinkAttribute::asU64() const { return readScalar<uint64_t>("u64"); }
int32_t NetlinkAttribute::asI32() const { return readScalar<int32_t>("s32"); }

std::string NetlinkAttribute::asString() const {
    if (payload_.empty()) {
        throw DecodeError("Attribute " + std::to_string(type_) + " is an empty string payload");
    }
    size_t length = payload_.size();
    if (payload_[length - 1] == '\0') {
        --length;
    }
    return std::string(reinterpret_cast<const char*>(payload_.data()), length);
}

NetlinkAttributes NetlinkAttribute::asNested() const {
    try {
        return NetlinkAttributes::parse(payload_.data(), payload_.size());
    } catch (DecodeError& e) {
        e.addContext("Failed to read attribute " + std::to_string(type_) + " as nested");
        throw;
    }
}

NetlinkAttributes NetlinkAttributes::parse(const uint8_t* data, size_t length) {
    NetlinkAttributes result;
    if (length == 0) {
        return result;
    }

    const struct nlattr* pos = reinterpret_cast<const struct nlattr*>(data);
    int rem = static_cast<int>(length);

    while (nla_ok(pos, rem)) {
        const uint8_t* payload = static_cast<const uint8_t*>(nla_data(pos));
        uint16_t type = static_cast<uint16_t>(nla_type(pos));
        result.attributes_[type] = NetlinkAttribute(type, std::vector<uint8_t>(payload, payload + nla_len(pos)));
        pos = nla_next(pos, &rem);
    }

    // nla_next() steps over the padding of the last attribute too, which
    // can leave rem slightly negative. Anything positive is a cut-off header
    // or an attribute longer than the buffer.
    if (rem > 0) {
        throw DecodeError("Truncated attribute stream: " + std::to_string(rem) + " trailing bytes");
    }

    return result;
}

const NetlinkAttribute* NetlinkAttributes::find(uint16_t type) const {
    auto it = attributes_.find(type);
    return it == attributes_.end() ? nullptr : &it->second;
}

const NetlinkAttribute& NetlinkAttributes::get(uint16_t type) const {
    const NetlinkAttribute* attribute = find(type);
    if (!attribute) {
        throw DecodeError("Missing attribute " + std::to_string(type));
    }
    return *attribute;
}

NetlinkAttributes NetlinkMessage::attributes() const {
    return NetlinkAttributes::parse(attributeData.data(), attributeData.size());
}

// Extended ack attributes start at offset within the message.
static void decodeExtAck(NetlinkMessage& message, const struct nlmsghdr* header, size_t offset) {
    if (!(header->nlmsg_flags & NLM_F_ACK_TLVS) || offset >= header->nlmsg_len) {
        return;
    }

    const uint8_t* base = reinterpret_cast<const uint8_t*>(header);
    NetlinkAttributes tlvs = NetlinkAttributes::parse(base + offset, header->nlmsg_len - offset);
    if (const NetlinkAttribute* text = tlvs.find(NLMSGERR_ATTR_MSG)) {
        message.errorMessage = text->asString();
    }
}

static void decodeError(NetlinkMessage& message, const struct nlmsghdr* header) {
    if (static_cast<size_t>(nlmsg_datalen(header)) < sizeof(struct nlmsgerr)) {
        throw DecodeError("Truncated netlink error message");
    }

    const struct nlmsgerr* err = static_cast<const struct nlmsgerr*>(nlmsg_data(header));
    message.error = err->error;
    message.kind = err->error == 0 ? NetlinkMessage::Kind::Ack : NetlinkMessage::Kind::Error;

    if (message.kind == NetlinkMessage::Kind::Ack) {
        return;
    }

    // The echoed request is only the header when the kernel capped it.
    size_t offset = NLMSG_HDRLEN + sizeof(struct nlmsgerr);
    if ((header->nlmsg_flags & NLM_F_ACK_TLVS) && !(header->nlmsg_flags & NLM_F_CAPPED)) {
        if (err->msg.nlmsg_len < sizeof(struct nlmsghdr)) {
            throw DecodeError("Malformed echoed request in netlink error message");
        }
        offset += err->msg.nlmsg_len - sizeof(struct nlmsghdr);
    }
    decodeExtAck(message, header, offset);
}

// A dump whose callback failed ends with a DONE carrying the negative errno.
static void decodeDone(NetlinkMessage& message, const struct nlmsghdr* header) {
    message.kind = NetlinkMessage::Kind::Done;
    if (static_cast<size_t>(nlmsg_datalen(header)) < sizeof(int)) {
        return;
    }

    int status;
    std::memcpy(&status, nlmsg_data(header), sizeof(status));
    message.error = status;

    if (status < 0) {
        decodeExtAck(message, header, NLMSG_HDRLEN + NLMSG_ALIGN(sizeof(int)));
    }
}

NetlinkMessage NetlinkMessage::decode(const struct nlmsghdr* header) {
    NetlinkMessage message;
    message.type = header->nlmsg_type;
    message.flags = header->nlmsg_flags;
    message.sequence = header->nlmsg_seq;

    if (header->nlmsg_type == NLMSG_DONE) {
        decodeDone(message, header);
        return message;
    }

    if (header->nlmsg_type == NLMSG_ERROR) {
        decodeError(message, header);
        return message;
    }

    if (nlmsg_datalen(header) < static_cast<int>(GENL_HDRLEN)) {
        throw DecodeError("Truncated generic netlink header in message type " +
                          std::to_string(header->nlmsg_type));
    }

    const struct genlmsghdr* gnlh = static_cast<const struct genlmsghdr*>(nlmsg_data(header));
    message.command = gnlh->cmd;
    message.version = gnlh->version;

    const uint8_t* attrs = reinterpret_cast<const uint8_t*>(genlmsg_attrdata(gnlh, 0));
    int attrLength = genlmsg_attrlen(gnlh, 0);
    if (attrLength > 0) {
        message.attributeData.assign(attrs, attrs + attrLength);
    }

    return message;
}

std::vector<NetlinkMessage> NetlinkMessage::decodeBatch(const uint8_t* data, size_t length) {
    std::vector<NetlinkMessage> messages;
    struct nlmsghdr* header = reinterpret_cast<struct nlmsghdr*>(const_cast<uint8_t*>(data));
    int rem = static_cast<int>(length);

    while (nlmsg_ok(header, rem)) {
        if (header->nlmsg_type >= NLMSG_MIN_TYPE || header->nlmsg_type == NLMSG_DONE ||
            header->nlmsg_type == NLMSG_ERROR) {
            messages.push_back(decode(header));
        }
        header = nlmsg_next(header, &rem);
    }

    if (rem > 0) {
        throw DecodeError("Truncated netlink message: " + std::to_string(rem) + " trailing bytes");
    }

    return messages;
}

void NetlinkRequest::MsgDeleter::operator()(struct nl_msg* msg) const {
    nlmsg_free(msg);
}

NetlinkRequest::NetlinkRequest(struct nl_msg* msg) : msg_(msg) {}

std::vector<uint8_t> NetlinkRequest::bytes() const {
    const struct nlmsghdr* header = nlmsg_hdr(msg_.get());
    const uint8_t* begin = reinterpret_cast<const uint8_t*>(header);
    return std::vector<uint8_t>(begin, begin + header->nlmsg_len);
}

static NetlinkRequest createRequest(uint16_t familyId, int flags, uint8_t command) {
    struct nl_msg* msg = nlmsg_alloc();
    if (!msg) {
        throw TransportError("Failed to allocate netlink message");
    }

    NetlinkRequest request(msg);
    if (!genlmsg_put(msg, NL_AUTO_PORT, NL_AUTO_SEQ, familyId, 0, flags, command, 0)) {
        throw TransportError("Failed to put generic netlink header");
    }
    return request;
}

static void putU32(const NetlinkRequest& request, int type, uint32_t value, const char* name) {
    int err = nla_put_u32(request.get(), type, value);
    if (err < 0) {
        throw TransportError(std::string("Failed to add ") + name + " attribute: " + nl_geterror(err));
    }
}

NetlinkRequest createGetInterfaceRequest(uint16_t familyId) {
    return createRequest(familyId, NLM_F_REQUEST | NLM_F_DUMP, NL80211_CMD_GET_INTERFACE);
}

NetlinkRequest createTriggerScanRequest(uint16_t familyId, uint32_t interfaceIndex) {
    NetlinkRequest request = createRequest(familyId, NLM_F_REQUEST | NLM_F_ACK, NL80211_CMD_TRIGGER_SCAN);
    putU32(request, NL80211_ATTR_IFINDEX, interfaceIndex, "interface index");
    putU32(request, NL80211_ATTR_SCAN_FLAGS, NL80211_SCAN_FLAG_AP, "scan flags");
    return request;
}

NetlinkRequest createGetScanRequest(uint16_t familyId, uint32_t interfaceIndex) {
    NetlinkRequest request = createRequest(familyId, NLM_F_REQUEST | NLM_F_DUMP, NL80211_CMD_GET_SCAN);
    putU32(request, NL80211_ATTR_IFINDEX, interfaceIndex, "interface index");
    return request;
}
