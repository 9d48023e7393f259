#pragma once

#include "quic_header.h"
#include <cstdint>
#include <cstddef>
#include <vector>

namespace quicwire {
namespace quic {

/**
 * Split one UDP datagram into its coalesced packets.
 *
 * Parses the header at offset 0, then keeps going while the last header is
 * a long header with a payload length: the next packet starts right after
 * that payload. A short header has no length, so it always ends the scan,
 * as does a long header whose payload reaches the end of the datagram.
 *
 * Any header that fails to parse fails the whole datagram; no partial list
 * is returned. An empty datagram is truncated_input.
 *
 * @param data Datagram bytes (must outlive the returned headers' raw spans)
 * @param len Datagram length
 * @param config Parser options
 * @return One HeaderOffset per packet, in wire order
 */
result<std::vector<HeaderOffset>> parse_datagram(const uint8_t* data, size_t len,
                                                 const ParserConfig& config = {});

inline result<std::vector<HeaderOffset>> parse_datagram(const std::vector<uint8_t>& datagram,
                                                        const ParserConfig& config = {}) {
    return parse_datagram(datagram.data(), datagram.size(), config);
}

} // namespace quic
} // namespace quicwire
