/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: test_message.cpp

    Description:
        Unit tests for the wire codec: exact byte layouts of the three
        messages, rejection of foreign or truncated datagrams, and the TCP
        request line.

        All values are checked against hand-written byte arrays so a change
        in field order or byte order fails here first.

*******************************************************************************/

#include "common/message.h"
#include "common/logger.h"

#include <iostream>
#include <cassert>
#include <cstring>
#include <vector>

using namespace netspeed;

int main() {
    Logger::set_level(LogLevel::INFO);
    Logger::info("Running Message tests...");

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Offer byte layout... ";
        try {
            std::vector<uint8_t> bytes = OfferMessage(0x1234, 0x5678).serialize();
            const uint8_t expected[] = {0xAB, 0xCD, 0xDC, 0xBA, 0x02,
                                        0x12, 0x34, 0x56, 0x78};
            assert(bytes.size() == OfferMessage::SIZE);
            assert(std::memcmp(bytes.data(), expected, sizeof(expected)) == 0);

            auto decoded = OfferMessage::deserialize(bytes.data(), bytes.size());
            assert(decoded);
            assert(decoded->udp_port == 0x1234);
            assert(decoded->tcp_port == 0x5678);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Request byte layout... ";
        try {
            std::vector<uint8_t> bytes = RequestMessage(1000000).serialize();
            const uint8_t expected[] = {0xAB, 0xCD, 0xDC, 0xBA, 0x03,
                                        0x00, 0x00, 0x00, 0x00, 0x00, 0x0F, 0x42, 0x40};
            assert(bytes.size() == RequestMessage::SIZE);
            assert(std::memcmp(bytes.data(), expected, sizeof(expected)) == 0);

            auto decoded = RequestMessage::deserialize(bytes.data(), bytes.size());
            assert(decoded);
            assert(decoded->file_size == 1000000);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Payload header and data... ";
        try {
            PayloadMessage msg;
            msg.total_segments = 3;
            msg.current_segment = 2;
            msg.data.assign(4, 'Y');

            std::vector<uint8_t> bytes = msg.serialize();
            assert(bytes.size() == PayloadMessage::HEADER_SIZE + 4);
            assert(bytes[4] == 0x04);
            assert(bytes[12] == 3);         // last byte of total_segments
            assert(bytes[20] == 2);         // last byte of current_segment
            assert(bytes[21] == 'Y');

            // In-place header matches the full serializer
            uint8_t header[PayloadMessage::HEADER_SIZE];
            msg.serialize_header(header);
            assert(std::memcmp(header, bytes.data(), sizeof(header)) == 0);

            auto decoded = PayloadMessage::deserialize(bytes.data(), bytes.size());
            assert(decoded);
            assert(decoded->total_segments == 3);
            assert(decoded->current_segment == 2);
            assert(decoded->data.size() == 4);

            // A bare header is a valid empty segment
            auto empty = PayloadMessage::deserialize(bytes.data(), PayloadMessage::HEADER_SIZE);
            assert(empty);
            assert(empty->data.empty());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Foreign and truncated datagrams rejected... ";
        try {
            std::vector<uint8_t> offer = OfferMessage(1, 2).serialize();

            // Wrong cookie
            std::vector<uint8_t> bad = offer;
            bad[0] = 0x00;
            assert(!OfferMessage::deserialize(bad.data(), bad.size()));
            assert(!Message::deserialize(bad.data(), bad.size()));

            // Truncated
            assert(!OfferMessage::deserialize(offer.data(), offer.size() - 1));
            assert(!Message::deserialize(offer.data(), 3));
            assert(!Message::deserialize(nullptr, 0));

            // Right cookie, wrong type for the decoder
            assert(!RequestMessage::deserialize(offer.data(), offer.size()));
            assert(!PayloadMessage::deserialize(offer.data(), offer.size()));

            // Unknown type
            bad = offer;
            bad[4] = 0x07;
            assert(!Message::deserialize(bad.data(), bad.size()));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Generic decode dispatches on type... ";
        try {
            std::vector<uint8_t> bytes = RequestMessage(42).serialize();
            auto msg = Message::deserialize(bytes.data(), bytes.size());
            assert(msg);
            assert(msg->type == MessageType::REQUEST);
            assert(static_cast<RequestMessage*>(msg.get())->file_size == 42);

            bytes = OfferMessage(7, 8).serialize();
            msg = Message::deserialize(bytes.data(), bytes.size());
            assert(msg && msg->type == MessageType::OFFER);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: TCP size line... ";
        try {
            assert(format_size_line(5000) == "5000\n");
            assert(parse_size_line("5000") == 5000u);
            assert(parse_size_line(" 5000\r") == 5000u);
            assert(parse_size_line("0") == 0u);
            assert(parse_size_line("18446744073709551615") == UINT64_MAX);

            assert(!parse_size_line(""));
            assert(!parse_size_line("   "));
            assert(!parse_size_line("abc"));
            assert(!parse_size_line("-5"));
            assert(!parse_size_line("+5"));
            assert(!parse_size_line("12 34"));
            assert(!parse_size_line("18446744073709551616"));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: 64-bit byte order helpers... ";
        try {
            uint64_t value = 0x0102030405060708ULL;
            uint64_t wire = hton64(value);
            const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&wire);
            assert(bytes[0] == 0x01);
            assert(bytes[7] == 0x08);
            assert(ntoh64(wire) == value);
            assert(ntoh16(hton16(0xBEEF)) == 0xBEEF);
            assert(ntoh32(hton32(MAGIC_COOKIE)) == MAGIC_COOKIE);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 8: Strict decimal arguments... ";
        try {
            assert(parse_decimal("5") == 5u);
            assert(parse_decimal("1000000") == 1000000u);
            assert(parse_decimal("18446744073709551615") == UINT64_MAX);

            // Signs and whitespace anywhere are rejected, a leading
            // space must not let a negative number wrap around
            assert(!parse_decimal(" -5"));
            assert(!parse_decimal("-5"));
            assert(!parse_decimal("+5"));
            assert(!parse_decimal(" 5"));
            assert(!parse_decimal("5 "));
            assert(!parse_decimal("\t7"));
            assert(!parse_decimal(""));
            assert(!parse_decimal("0x10"));
            assert(!parse_decimal("18446744073709551616"));

            // The TCP line still tolerates surrounding whitespace, but not a sign
            assert(parse_size_line(" 5\r") == 5u);
            assert(!parse_size_line(" -5"));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return (failed == 0) ? 0 : 1;
}
