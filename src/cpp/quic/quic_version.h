#pragma once

#include "quic_types.h"
#include <cstdint>
#include <cstddef>
#include <vector>

namespace quicwire {
namespace quic {

/**
 * Decides which sub-format a long header takes.
 *
 * The header codec asks this once per long header: a version-negotiation
 * header stops after the source connection ID, every other long header
 * carries a payload length and a packet number.
 */
class VersionValidator {
public:
    virtual ~VersionValidator() = default;

    virtual bool is_version_negotiation(const Version& version) const noexcept = 0;
};

/**
 * Treats the all-zero version as the negotiation sentinel.
 */
class DefaultVersionValidator : public VersionValidator {
public:
    bool is_version_negotiation(const Version& version) const noexcept override {
        return version.value() == Version::NEGOTIATION;
    }

    /**
     * Process-wide instance used when a ParserConfig names no validator.
     */
    static const DefaultVersionValidator& instance() noexcept {
        static const DefaultVersionValidator validator{};
        return validator;
    }
};

/**
 * Versions this stack can speak or must tolerate:
 * - 0x00000001 (QUIC v1)
 * - 0xff0000xx (IETF drafts)
 * - 0x?a?a?a?a (reserved, used to exercise version negotiation)
 */
bool is_supported_version(const Version& version) noexcept;

/**
 * Decode the supported-versions list that follows a version-negotiation
 * header.
 *
 * @param data Start of the list (the payload offset of the header)
 * @param len Bytes remaining in the packet
 * @return Versions in wire order, truncated_input if len is not a
 *         multiple of 4
 */
result<std::vector<Version>> parse_supported_versions(const uint8_t* data, size_t len);

/**
 * Encode a supported-versions list (4 bytes per version).
 */
std::vector<uint8_t> serialize_supported_versions(const std::vector<Version>& versions);

} // namespace quic
} // namespace quicwire
