// Coalesced datagram splitting

#include "quic_datagram.h"
#include "../core/logger.h"

namespace quicwire {
namespace quic {

result<std::vector<HeaderOffset>> parse_datagram(const uint8_t* data, size_t len,
                                                 const ParserConfig& config) {
    std::vector<HeaderOffset> headers;

    auto first = parse_header(data, len, 0, config);
    if (first.is_err()) {
        LOG_DEBUG("QUIC", "Dropping %zu byte datagram: %s",
                  len, core::error_code_to_string(first.error()));
        return first.error();
    }
    headers.push_back(std::move(first).value());

    // 64-bit so a hostile payload length cannot wrap the running total
    uint64_t consumed = 0;

    while (true) {
        const HeaderOffset& last = headers.back();
        const auto* long_hdr = std::get_if<LongHeader>(&last.header);
        if (!long_hdr || !long_hdr->payload_length) {
            break;
        }

        uint64_t header_size = last.offset - consumed;
        uint64_t payload_length = *long_hdr->payload_length;
        consumed += header_size + payload_length;

        if (consumed >= len) {
            if (consumed > len) {
                LOG_DEBUG("QUIC", "Packet %zu payload overruns datagram (%llu > %zu)",
                          headers.size(), static_cast<unsigned long long>(consumed), len);
            }
            break;
        }

        auto next = parse_header(data, len, static_cast<size_t>(consumed), config);
        if (next.is_err()) {
            LOG_DEBUG("QUIC", "Dropping datagram at packet %zu (offset %llu): %s",
                      headers.size(), static_cast<unsigned long long>(consumed),
                      core::error_code_to_string(next.error()));
            return next.error();
        }
        headers.push_back(std::move(next).value());
    }

    return headers;
}

} // namespace quic
} // namespace quicwire
