#include "WireCodec.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace lanbeacon {

    namespace {

        void appendUint16(std::vector<uint8_t>& buffer, uint16_t value) {
            uint16_t bigEndian = hton16(value);
            buffer.insert(buffer.end(),
                reinterpret_cast<uint8_t*>(&bigEndian),
                reinterpret_cast<uint8_t*>(&bigEndian) + 2);
        }

        uint16_t readUint16(const std::vector<uint8_t>& buffer, size_t position) {
            uint16_t bigEndian;
            memcpy(&bigEndian, &buffer[position], 2);
            return ntoh16(bigEndian);
        }

    } // namespace

    // ------------------------------------------------------------
    // STRING FRAMING
    // ------------------------------------------------------------
    std::vector<uint8_t> encodeString(const std::string& value) {
        if (value.size() > MAX_STRING_BYTES) {
            throw std::length_error("encodeString: " + std::to_string(value.size()) + " bytes exceeds the 16-bit length field");
        }

        std::vector<uint8_t> buffer;
        buffer.reserve(LENGTH_FIELD_SIZE + value.size());

        appendUint16(buffer, static_cast<uint16_t>(value.size()));
        buffer.insert(buffer.end(), value.begin(), value.end());

        return buffer;
    }

    bool decodeString(const std::vector<uint8_t>& buffer, size_t offset, std::string& out, size_t& consumed) {
        if (offset > buffer.size() || buffer.size() - offset < LENGTH_FIELD_SIZE) return false;

        const size_t length = readUint16(buffer, offset);
        const size_t start = offset + LENGTH_FIELD_SIZE;
        if (buffer.size() - start < length) return false; // truncated

        out.assign(buffer.begin() + start, buffer.begin() + start + length);
        consumed = LENGTH_FIELD_SIZE + length;
        return true;
    }

    bool hasPrefix(const std::vector<uint8_t>& buffer, const std::vector<uint8_t>& prefix) {
        if (buffer.size() < prefix.size()) return false;
        return std::equal(prefix.begin(), prefix.end(), buffer.begin());
    }

    // ------------------------------------------------------------
    // DATAGRAMS
    // ------------------------------------------------------------
    std::vector<uint8_t> buildProbe(const std::string& tag) {
        return encodeString(tag);
    }

    std::vector<uint8_t> buildReply(const std::string& tag, uint16_t port, const std::string& payload) {
        std::vector<uint8_t> buffer = encodeString(tag);
        std::vector<uint8_t> encodedPayload = encodeString(payload);
        buffer.reserve(buffer.size() + PORT_FIELD_SIZE + encodedPayload.size());

        appendUint16(buffer, port);
        buffer.insert(buffer.end(), encodedPayload.begin(), encodedPayload.end());

        return buffer;
    }

    bool parseReply(const std::vector<uint8_t>& buffer, const std::vector<uint8_t>& prefix, Reply& outReply) {
        if (!hasPrefix(buffer, prefix)) return false;

        size_t position = prefix.size();
        if (buffer.size() - position < PORT_FIELD_SIZE) return false;

        Reply reply;
        reply.port = readUint16(buffer, position);
        position += PORT_FIELD_SIZE;

        size_t consumed = 0;
        if (!decodeString(buffer, position, reply.payload, consumed)) return false;

        outReply = std::move(reply);
        return true;
    }

} // namespace lanbeacon
