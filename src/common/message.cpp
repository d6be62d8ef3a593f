/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: message.cpp

    Description:
        Serialization and validating deserialization for the speed test wire
        protocol declared in message.h.

    Serialization Approach:
        Every field is converted with hton16/32/64 and appended to a
        std::vector<uint8_t> through the append_* helpers below. Reading is
        the mirror image with memcpy + ntoh (no reinterpret_cast of packed
        structs, so alignment and padding never matter).

    Validation Order (every deserialize):
        1. size >= fixed size of the message kind
        2. cookie == MAGIC_COOKIE
        3. type  == expected MessageType
        Failing any step returns nullptr. Nothing here throws.

*******************************************************************************/

#include "common/message.h"

#include <cstring>
#include <cctype>
#include <limits>

namespace netspeed {

//==============================================================================
// SECTION 1: FIELD WRITERS / READERS
//==============================================================================

static void append_u16(std::vector<uint8_t>& buffer, uint16_t val) {
    uint16_t net = hton16(val);
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&net);
    buffer.insert(buffer.end(), bytes, bytes + 2);
}

static void append_u32(std::vector<uint8_t>& buffer, uint32_t val) {
    uint32_t net = hton32(val);
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&net);
    buffer.insert(buffer.end(), bytes, bytes + 4);
}

static void append_u64(std::vector<uint8_t>& buffer, uint64_t val) {
    uint64_t net = hton64(val);
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&net);
    buffer.insert(buffer.end(), bytes, bytes + 8);
}

static void write_u32(uint8_t* out, uint32_t val) {
    uint32_t net = hton32(val);
    std::memcpy(out, &net, 4);
}

static void write_u64(uint8_t* out, uint64_t val) {
    uint64_t net = hton64(val);
    std::memcpy(out, &net, 8);
}

static uint16_t read_u16(const uint8_t* ptr) {
    uint16_t val;
    std::memcpy(&val, ptr, 2);
    return ntoh16(val);
}

static uint32_t read_u32(const uint8_t* ptr) {
    uint32_t val;
    std::memcpy(&val, ptr, 4);
    return ntoh32(val);
}

static uint64_t read_u64(const uint8_t* ptr) {
    uint64_t val;
    std::memcpy(&val, ptr, 8);
    return ntoh64(val);
}

// Shared steps 1-3 of the validation order
static bool header_matches(const uint8_t* data, size_t size,
                           size_t required_size, MessageType expected) {
    if (data == nullptr || size < required_size) return false;
    if (read_u32(data) != MAGIC_COOKIE) return false;
    return data[4] == static_cast<uint8_t>(expected);
}

//==============================================================================
// SECTION 2: BASE MESSAGE
//==============================================================================

void Message::serialize_header(std::vector<uint8_t>& buffer) const {
    append_u32(buffer, magic_cookie);
    buffer.push_back(static_cast<uint8_t>(type));
}

std::unique_ptr<Message> Message::deserialize(const uint8_t* data, size_t size) {
    if (data == nullptr || size < HEADER_SIZE) return nullptr;
    if (read_u32(data) != MAGIC_COOKIE) return nullptr;

    switch (static_cast<MessageType>(data[4])) {
        case MessageType::OFFER:
            return OfferMessage::deserialize(data, size);
        case MessageType::REQUEST:
            return RequestMessage::deserialize(data, size);
        case MessageType::PAYLOAD:
            return PayloadMessage::deserialize(data, size);
        default:
            return nullptr;
    }
}

//==============================================================================
// SECTION 3: OFFER MESSAGE
//==============================================================================
//
// Offset  Size  Field
// 0       4     cookie
// 4       1     type (0x2)
// 5       2     udp_port
// 7       2     tcp_port
//

std::vector<uint8_t> OfferMessage::serialize() const {
    std::vector<uint8_t> buffer;
    buffer.reserve(SIZE);
    serialize_header(buffer);
    append_u16(buffer, udp_port);
    append_u16(buffer, tcp_port);
    return buffer;
}

std::unique_ptr<OfferMessage> OfferMessage::deserialize(const uint8_t* data, size_t size) {
    if (!header_matches(data, size, SIZE, MessageType::OFFER)) return nullptr;

    auto msg = std::make_unique<OfferMessage>();
    msg->udp_port = read_u16(data + 5);
    msg->tcp_port = read_u16(data + 7);
    return msg;
}

//==============================================================================
// SECTION 4: REQUEST MESSAGE
//==============================================================================
//
// Offset  Size  Field
// 0       4     cookie
// 4       1     type (0x3)
// 5       8     file_size
//

std::vector<uint8_t> RequestMessage::serialize() const {
    std::vector<uint8_t> buffer;
    buffer.reserve(SIZE);
    serialize_header(buffer);
    append_u64(buffer, file_size);
    return buffer;
}

std::unique_ptr<RequestMessage> RequestMessage::deserialize(const uint8_t* data, size_t size) {
    if (!header_matches(data, size, SIZE, MessageType::REQUEST)) return nullptr;

    auto msg = std::make_unique<RequestMessage>();
    msg->file_size = read_u64(data + 5);
    return msg;
}

//==============================================================================
// SECTION 5: PAYLOAD MESSAGE
//==============================================================================
//
// Offset  Size  Field
// 0       4     cookie
// 4       1     type (0x4)
// 5       8     total_segments
// 13      8     current_segment
// 21      n     data (n = datagram length - 21)
//

void PayloadMessage::serialize_header(uint8_t* out) const {
    write_u32(out, magic_cookie);
    out[4] = static_cast<uint8_t>(type);
    write_u64(out + 5, total_segments);
    write_u64(out + 13, current_segment);
}

std::vector<uint8_t> PayloadMessage::serialize() const {
    std::vector<uint8_t> buffer(HEADER_SIZE + data.size());
    serialize_header(buffer.data());
    if (!data.empty()) {
        std::memcpy(buffer.data() + HEADER_SIZE, data.data(), data.size());
    }
    return buffer;
}

std::unique_ptr<PayloadMessage> PayloadMessage::deserialize(const uint8_t* data, size_t size) {
    if (!header_matches(data, size, HEADER_SIZE, MessageType::PAYLOAD)) return nullptr;

    auto msg = std::make_unique<PayloadMessage>();
    msg->total_segments = read_u64(data + 5);
    msg->current_segment = read_u64(data + 13);
    msg->data.assign(data + HEADER_SIZE, data + size);
    return msg;
}

//==============================================================================
// SECTION 6: TCP REQUEST LINE
//==============================================================================

std::string format_size_line(uint64_t file_size) {
    return std::to_string(file_size) + "\n";
}

std::optional<uint64_t> parse_decimal(const std::string& text) {
    if (text.empty()) return std::nullopt;

    const uint64_t max = std::numeric_limits<uint64_t>::max();
    uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;

        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (max - digit) / 10) return std::nullopt;  // overflow
        value = value * 10 + digit;
    }
    return value;
}

std::optional<uint64_t> parse_size_line(const std::string& line) {
    size_t begin = 0;
    size_t end = line.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(line[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(line[end - 1]))) end--;

    return parse_decimal(line.substr(begin, end - begin));
}

} // namespace netspeed
