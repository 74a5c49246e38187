#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace b64stream {

struct base64
{
    static constexpr char padding = '=';

    /// Classification values returned by lookup() besides 0..63.
    static constexpr std::uint8_t pad_value     = 0x40;
    static constexpr std::uint8_t invalid_value = 0xff;

    struct quad_result
    {
        std::size_t length;     // decoded bytes written, 1..3
        bool        padded;     // the group ends a unit
        bool        valid;
    };

    /// 6-bit value of c, pad_value for '=' or invalid_value.
    static std::uint8_t
    lookup(unsigned char c);

    /// Decode one 4 byte group into dst[0..2].
    /// Padding is only accepted in the last one or two positions.
    static quad_result
    decode_quad(const std::uint8_t *src, std::uint8_t *dst);

    std::size_t
    needed_encoded_length(std::size_t length_of_data) const;

    std::size_t
    needed_decoded_length(std::size_t length_of_encoded_data) const;

    /// Encode with padding and no line breaks. dst must hold
    /// needed_encoded_length(src_len) bytes. Returns the bytes written.
    std::size_t
    encode(const void *src, std::size_t src_len, char *dst) const;
};

std::string to_base64(std::string const& in);

}
