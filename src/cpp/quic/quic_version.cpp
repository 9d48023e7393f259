#include "quic_version.h"

namespace quicwire {
namespace quic {

bool is_supported_version(const Version& version) noexcept {
    uint32_t v = version.value();

    if (v == 0x00000001) return true;

    if ((v & 0xFFFFFF00) == 0xFF000000) return true;

    if ((v & 0x0F0F0F0F) == 0x0A0A0A0A) return true;

    return false;
}

result<std::vector<Version>> parse_supported_versions(const uint8_t* data, size_t len) {
    if (len % Version::WIRE_SIZE != 0) {
        return error_code::truncated_input;
    }

    std::vector<Version> versions;
    versions.reserve(len / Version::WIRE_SIZE);
    for (size_t pos = 0; pos < len; pos += Version::WIRE_SIZE) {
        auto version = Version::from_bytes(data + pos, Version::WIRE_SIZE);
        if (version.is_err()) {
            return version.error();
        }
        versions.push_back(version.value());
    }
    return versions;
}

std::vector<uint8_t> serialize_supported_versions(const std::vector<Version>& versions) {
    std::vector<uint8_t> out(versions.size() * Version::WIRE_SIZE);
    for (size_t i = 0; i < versions.size(); i++) {
        versions[i].write(out.data() + i * Version::WIRE_SIZE);
    }
    return out;
}

} // namespace quic
} // namespace quicwire
