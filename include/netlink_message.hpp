#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

struct nl_msg;
struct nlmsghdr;

class NetlinkAttributes;

// One decoded attribute. The payload stays raw; readers check the width
// of the payload against the type they are asked for.
class NetlinkAttribute {
public:
    NetlinkAttribute() = default;
    NetlinkAttribute(uint16_t type, std::vector<uint8_t> payload);

    uint16_t type() const { return type_; }
    const std::vector<uint8_t>& payload() const { return payload_; }

    uint8_t asU8() const;
    uint16_t asU16() const;
    uint32_t asU32() const;
    uint64_t asU64() const;
    int32_t asI32() const;

    // NUL-terminated string attribute; the terminator is stripped.
    std::string asString() const;

    // Re-reads the payload as an attribute sequence.
    NetlinkAttributes asNested() const;

private:
    template <typename T>
    T readScalar(const char* typeName) const;

    uint16_t type_ = 0;
    std::vector<uint8_t> payload_;
};

// Flat attribute sequence keyed by type tag. A repeated tag replaces the
// earlier one. Unknown tags are kept and simply never looked up.
class NetlinkAttributes {
public:
    static NetlinkAttributes parse(const uint8_t* data, size_t length);

    const NetlinkAttribute* find(uint16_t type) const;
    const NetlinkAttribute& get(uint16_t type) const;
    bool has(uint16_t type) const { return attributes_.count(type) != 0; }
    size_t size() const { return attributes_.size(); }

private:
    std::map<uint16_t, NetlinkAttribute> attributes_;
};

struct NetlinkMessage {
    enum class Kind {
        Data,
        Done,
        Ack,
        Error
    };

    Kind kind = Kind::Data;
    uint16_t type = 0;
    uint16_t flags = 0;
    uint32_t sequence = 0;

    // Generic netlink sub-header, only meaningful for Data messages.
    uint8_t command = 0;
    uint8_t version = 0;

    // Negative errno and the kernel's extended ack text for Error messages
    // and for a Done that ended a failed dump.
    int error = 0;
    std::string errorMessage;

    // Attribute bytes following the generic netlink sub-header.
    std::vector<uint8_t> attributeData;

    NetlinkAttributes attributes() const;

    static NetlinkMessage decode(const struct nlmsghdr* header);
    static std::vector<NetlinkMessage> decodeBatch(const uint8_t* data, size_t length);
};

// Owns a libnl message built for sending.
class NetlinkRequest {
public:
    explicit NetlinkRequest(struct nl_msg* msg);

    struct nl_msg* get() const { return msg_.get(); }
    std::vector<uint8_t> bytes() const;

private:
    struct MsgDeleter {
        void operator()(struct nl_msg* msg) const;
    };

    std::unique_ptr<struct nl_msg, MsgDeleter> msg_;
};

NetlinkRequest createGetInterfaceRequest(uint16_t familyId);
NetlinkRequest createTriggerScanRequest(uint16_t familyId, uint32_t interfaceIndex);
NetlinkRequest createGetScanRequest(uint16_t familyId, uint32_t interfaceIndex);
