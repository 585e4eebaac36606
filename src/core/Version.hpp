/**
 * @file Version.hpp
 * @brief Decoding of FMOD's packed version number.
 */

#ifndef FMODPP_CORE_VERSION_HPP
#define FMODPP_CORE_VERSION_HPP

#include <fmod_common.h>
#include <compare>
#include <cstdint>
#include <string>

namespace fmodpp {

/**
 * @brief Engine version as product.major.minor.
 *
 * FMOD packs the version as 0xPPPPMMmm where each hexadecimal digit is a
 * decimal digit, so 0x00020222 reads as 2.02.22.
 */
struct Version {
    uint16_t product = 0;
    uint8_t major = 0;
    uint8_t minor = 0;

    static constexpr Version from_raw(unsigned int raw) {
        Version version;
        version.product = static_cast<uint16_t>(decode_digits(raw >> 16, 4));
        version.major = static_cast<uint8_t>(decode_digits(raw >> 8, 2));
        version.minor = static_cast<uint8_t>(decode_digits(raw, 2));
        return version;
    }

    constexpr unsigned int into_raw() const {
        return (encode_digits(product, 4) << 16) | (encode_digits(major, 2) << 8) | encode_digits(minor, 2);
    }

    /**
     * @brief Same product and major release; minor releases stay ABI compatible.
     */
    constexpr bool is_compatible_with(const Version& other) const {
        return product == other.product && major == other.major;
    }

    std::string to_string() const;

    friend constexpr auto operator<=>(const Version&, const Version&) = default;

private:
    static constexpr unsigned int decode_digits(unsigned int packed, int digits) {
        unsigned int value = 0;
        for (int i = digits - 1; i >= 0; --i) {
            value = value * 10 + ((packed >> (i * 4)) & 0xF);
        }
        return value;
    }

    static constexpr unsigned int encode_digits(unsigned int value, int digits) {
        unsigned int packed = 0;
        for (int i = 0; i < digits; ++i) {
            packed |= (value % 10) << (i * 4);
            value /= 10;
        }
        return packed;
    }
};

/**
 * @brief Version of the headers this layer was compiled against.
 */
inline constexpr Version HEADER_VERSION = Version::from_raw(FMOD_VERSION);

} // namespace fmodpp

#endif // FMODPP_CORE_VERSION_HPP
