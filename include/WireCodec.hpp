#pragma once
#ifndef LANBEACON_WIRE_CODEC_HPP
#define LANBEACON_WIRE_CODEC_HPP

#include "DiscoveryConfig.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace lanbeacon {

    // ============================================================
    //  BYTE ORDER
    // ============================================================
    inline uint16_t hton16(uint16_t value) {
        return static_cast<uint16_t>(((value & 0xFF00) >> 8) | ((value & 0x00FF) << 8));
    }

    inline uint16_t ntoh16(uint16_t value) {
        return hton16(value);
    }

    // ============================================================
    //  REPLY FRAME
    // ============================================================
    struct Reply {
        uint16_t port = 0;    // advertised listening port
        std::string payload;  // opaque beacon data
    };

    // ============================================================
    //  FUNCTIONS
    // ============================================================

    /** Encodes a string as [length(2) big-endian][bytes].
     *  Throws std::length_error if the string is longer than MAX_STRING_BYTES.
     */
    std::vector<uint8_t> encodeString(const std::string& value);

    /** Decodes a string written by encodeString, starting at `offset`.
     *  On success stores the string in `out` and the number of bytes read
     *  (length field included) in `consumed`.
     *  Returns false if the buffer is truncated.
     */
    bool decodeString(const std::vector<uint8_t>& buffer, size_t offset, std::string& out, size_t& consumed);

    /** True iff `buffer` begins with exactly the bytes of `prefix`. */
    bool hasPrefix(const std::vector<uint8_t>& buffer, const std::vector<uint8_t>& prefix);

    /** Probe datagram for a channel tag: encodeString(tag). */
    std::vector<uint8_t> buildProbe(const std::string& tag);

    /** Reply datagram as a beacon sends it:
     *  [encodeString(tag)] [port(2) big-endian] [encodeString(payload)]
     */
    std::vector<uint8_t> buildReply(const std::string& tag, uint16_t port, const std::string& payload);

    /** Parses a reply whose leading bytes must equal `prefix` (an encoded tag).
     *  Returns false on prefix mismatch, a missing port field or a truncated
     *  payload. Bytes following the payload are ignored.
     */
    bool parseReply(const std::vector<uint8_t>& buffer, const std::vector<uint8_t>& prefix, Reply& outReply);

} // namespace lanbeacon

#endif // LANBEACON_WIRE_CODEC_HPP
