/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: message.h

    Description:
        This header defines the wire protocol shared by the speed test server
        and client: the message type identifiers, the three fixed-layout
        binary messages, protocol constants, byte order helpers, and the
        ASCII size line used as the request on TCP connections.

        Core Components:
        - Protocol constants: magic cookie, discovery port, chunk sizes
        - MessageType enum: OFFER (0x2), REQUEST (0x3), PAYLOAD (0x4)
        - Message class hierarchy: Message base + OfferMessage,
          RequestMessage, PayloadMessage
        - Byte order utilities: hton16/32/64, ntoh16/32/64
        - TCP request line: format_size_line / parse_size_line

    Message Flow:

        Server → broadcast (UDP, discovery port, every second):
        ┌─────────────────────┐
        │ OfferMessage        │  "I am here, my data ports are U and T"
        └─────────────────────┘

        Client → Server (UDP, advertised UDP port):
        ┌─────────────────────┐
        │ RequestMessage      │  "send me file_size bytes"
        └─────────────────────┘

        Server → Client (UDP, one per chunk):
        ┌─────────────────────┐
        │ PayloadMessage      │  segment i of N + filler bytes
        └─────────────────────┘

        Client → Server (TCP, advertised TCP port):
            "<file_size in decimal>\n", then raw filler bytes flow back

    Wire Formats (all integers big-endian, no padding):

        Offer    (9 bytes):  u32 cookie | u8 type | u16 udp_port | u16 tcp_port
        Request  (13 bytes): u32 cookie | u8 type | u64 file_size
        Payload  (21 bytes + data):
                             u32 cookie | u8 type | u64 total_segments |
                             u64 current_segment | data...

        The payload data length is not encoded; it is the datagram length
        minus the 21-byte header.

    Validation Contract:
        Broadcast ports carry foreign traffic, so a datagram that is too
        short, carries a different cookie, or a different type is NOT an
        error. deserialize() returns nullptr ("not a match") and the caller
        simply drops it. No deserialize() in this file throws.

    Related Files:
        - message.cpp: field writers/readers and validation
        - transfer_stats.h: segment planning built on these layouts

*******************************************************************************/

#ifndef MESSAGE_H
#define MESSAGE_H

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>

namespace netspeed {

//==============================================================================
// SECTION 1: PROTOCOL CONSTANTS
//==============================================================================
//
// CRITICAL: These values appear on the wire. Changing them breaks
// compatibility with every deployed server and client.
//

// Identifies our packets among whatever else is broadcast on the LAN
constexpr uint32_t MAGIC_COOKIE = 0xABCDDCBA;

// Well-known port the client listens on for offers
constexpr uint16_t DEFAULT_DISCOVERY_PORT = 13117;

// Offers go to the limited broadcast address by default
constexpr const char* DEFAULT_BROADCAST_ADDRESS = "255.255.255.255";

// Filler bytes per UDP segment (payload only, header excluded)
constexpr size_t DEFAULT_UDP_CHUNK_SIZE = 1024;

// Filler bytes per send() on the TCP stream, also the client recv buffer
constexpr size_t DEFAULT_TCP_CHUNK_SIZE = 4096;

// Largest UDP payload an IPv4 datagram can carry (65535 - 20 IP - 8 UDP)
constexpr size_t MAX_DATAGRAM_SIZE = 65507;

//==============================================================================
// SECTION 2: MESSAGE TYPE ENUMERATION
//==============================================================================

enum class MessageType : uint8_t {
    // Server → broadcast. Advertises the two data-plane ports.
    OFFER = 0x2,

    // Client → server over UDP. Asks for file_size bytes of segments.
    REQUEST = 0x3,

    // Server → client over UDP. One sequenced chunk of a transfer.
    PAYLOAD = 0x4
};

//==============================================================================
// SECTION 3: MESSAGE CLASS HIERARCHY
//==============================================================================

//------------------------------------------------------------------------------
// 3.1 BASE MESSAGE
//------------------------------------------------------------------------------
//
// Every message starts with the same 5 bytes: cookie (u32) + type (u8).
// The cookie is a public field so tests can build deliberately foreign
// packets; regular code never changes it from MAGIC_COOKIE.
//

class Message {
public:
    // cookie (4) + type (1)
    static constexpr size_t HEADER_SIZE = 5;

    uint32_t magic_cookie;
    MessageType type;

    explicit Message(MessageType t)
        : magic_cookie(MAGIC_COOKIE), type(t) {}

    virtual ~Message() = default;

    virtual std::vector<uint8_t> serialize() const = 0;

    // Validates cookie and dispatches on the type byte.
    // Returns nullptr for anything that is not one of our messages.
    static std::unique_ptr<Message> deserialize(const uint8_t* data, size_t size);

protected:
    void serialize_header(std::vector<uint8_t>& buffer) const;
};

//------------------------------------------------------------------------------
// 3.2 OFFER MESSAGE (server → broadcast)
//------------------------------------------------------------------------------

class OfferMessage : public Message {
public:
    static constexpr size_t SIZE = 9;

    uint16_t udp_port;
    uint16_t tcp_port;

    OfferMessage() : Message(MessageType::OFFER), udp_port(0), tcp_port(0) {}
    OfferMessage(uint16_t udp, uint16_t tcp)
        : Message(MessageType::OFFER), udp_port(udp), tcp_port(tcp) {}

    std::vector<uint8_t> serialize() const override;
    static std::unique_ptr<OfferMessage> deserialize(const uint8_t* data, size_t size);
};

//------------------------------------------------------------------------------
// 3.3 REQUEST MESSAGE (client → server, UDP)
//------------------------------------------------------------------------------

class RequestMessage : public Message {
public:
    static constexpr size_t SIZE = 13;

    uint64_t file_size;

    RequestMessage() : Message(MessageType::REQUEST), file_size(0) {}
    explicit RequestMessage(uint64_t size)
        : Message(MessageType::REQUEST), file_size(size) {}

    std::vector<uint8_t> serialize() const override;
    static std::unique_ptr<RequestMessage> deserialize(const uint8_t* data, size_t size);
};

//------------------------------------------------------------------------------
// 3.4 PAYLOAD MESSAGE (server → client, UDP)
//------------------------------------------------------------------------------
//
// total_segments is fixed for the whole transfer; current_segment is
// 1-based. The server reuses one datagram buffer per transfer and only
// rewrites the header through serialize_header(out) for each segment.
//

class PayloadMessage : public Message {
public:
    static constexpr size_t HEADER_SIZE = 21;

    uint64_t total_segments;
    uint64_t current_segment;
    std::vector<uint8_t> data;

    PayloadMessage()
        : Message(MessageType::PAYLOAD), total_segments(0), current_segment(0) {}

    std::vector<uint8_t> serialize() const override;

    // Writes exactly HEADER_SIZE bytes to 'out'
    void serialize_header(uint8_t* out) const;

    static std::unique_ptr<PayloadMessage> deserialize(const uint8_t* data, size_t size);
};

//==============================================================================
// SECTION 4: TCP REQUEST LINE
//==============================================================================
//
// On TCP the request is the decimal size followed by '\n'.
//
// parse_size_line() accepts surrounding whitespace (a trailing "\r" from a
// telnet-style client included) and rejects everything else: signs,
// embedded spaces, non-digits, empty text, values above UINT64_MAX.
//
// parse_decimal() is the strict core: ASCII digits only, no whitespace and
// no sign. The command-line tools use it for every numeric argument.
//

std::string format_size_line(uint64_t file_size);
std::optional<uint64_t> parse_decimal(const std::string& text);
std::optional<uint64_t> parse_size_line(const std::string& line);

//==============================================================================
// SECTION 5: BYTE ORDER CONVERSION UTILITIES
//==============================================================================
//
// Host ↔ network (big-endian) conversion. POSIX htons/htonl stop at 32
// bits and the payload header needs 64-bit fields, so all widths are
// handled here the same way.
//
// On a big-endian host every conversion is the identity.
//

#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__

inline uint16_t hton16(uint16_t val) { return val; }
inline uint32_t hton32(uint32_t val) { return val; }
inline uint64_t hton64(uint64_t val) { return val; }

#else

inline uint16_t hton16(uint16_t val) {
    return static_cast<uint16_t>(((val & 0xFF) << 8) | ((val >> 8) & 0xFF));
}

inline uint32_t hton32(uint32_t val) {
    return ((val & 0xFF) << 24) | ((val & 0xFF00) << 8) |
           ((val >> 8) & 0xFF00) | ((val >> 24) & 0xFF);
}

inline uint64_t hton64(uint64_t val) {
    return ((uint64_t)hton32(val & 0xFFFFFFFF) << 32) | hton32(val >> 32);
}

#endif

// Byte swapping is symmetric
inline uint16_t ntoh16(uint16_t val) { return hton16(val); }
inline uint32_t ntoh32(uint32_t val) { return hton32(val); }
inline uint64_t ntoh64(uint64_t val) { return hton64(val); }

} // namespace netspeed

#endif // MESSAGE_H
