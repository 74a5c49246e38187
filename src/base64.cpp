#include "base64.hpp"

#include <array>

namespace b64stream {

constexpr char         base64::padding;
constexpr std::uint8_t base64::pad_value;
constexpr std::uint8_t base64::invalid_value;

namespace {
    const char base64_table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz"
        "0123456789+/";

    auto decode_table() -> std::array<std::uint8_t, 256> const&
    {
        static const std::array<std::uint8_t, 256> table = []
        {
            std::array<std::uint8_t, 256> result;
            result.fill(base64::invalid_value);
            for (std::uint8_t i = 0; i < 64; ++i)
                result[static_cast<unsigned char>(base64_table[i])] = i;
            result[static_cast<unsigned char>(base64::padding)] = base64::pad_value;
            return result;
        }();
        return table;
    }
}


std::uint8_t
base64::lookup(unsigned char c)
{
    return decode_table()[c];
}


/*
  Padding may only occupy position 3, or positions 2 and 3. Anything
  else, including "xx=y", is rejected.
*/
base64::quad_result
base64::decode_quad(const std::uint8_t *src, std::uint8_t *dst)
{
    auto&& table = decode_table();
    std::uint8_t v[4];
    for (int i = 0; i < 4; ++i)
        v[i] = table[src[i]];

    if (v[0] >= pad_value || v[1] >= pad_value)
        return { 0, false, false };

    std::size_t mark = 0;
    if (v[2] == pad_value) {
        if (v[3] != pad_value)
            return { 0, false, false };
        mark = 2;
    }
    else if (v[2] == invalid_value) {
        return { 0, false, false };
    }
    else if (v[3] == pad_value) {
        mark = 1;
    }
    else if (v[3] == invalid_value) {
        return { 0, false, false };
    }

    unsigned c = v[0];
    c = (c << 6) + v[1];
    c = (c << 6) + (mark == 2 ? 0 : v[2]);
    c = (c << 6) + (mark == 0 ? v[3] : 0);

    dst[0] = (c >> 16) & 0xff;
    dst[1] = (c >> 8) & 0xff;
    dst[2] = (c >> 0) & 0xff;

    return { 3 - mark, mark != 0, true };
}


std::size_t
base64::needed_encoded_length(std::size_t length_of_data) const
{
    return (length_of_data + 2) / 3 * 4;
}


std::size_t
base64::needed_decoded_length(std::size_t length_of_encoded_data) const
{
    return (length_of_encoded_data + 3) / 4 * 3;
}


std::size_t
base64::encode(const void *src, std::size_t src_len, char *dst) const
{
    const unsigned char *s    = static_cast<const unsigned char *>(src);
    char                *base = dst;
    std::size_t         i     = 0;

    while (i < src_len) {
        unsigned c;

        c = s[i++];
        c <<= 8;

        if (i < src_len)
            c += s[i];
        c <<= 8;
        i++;

        if (i < src_len)
            c += s[i];
        i++;

        *dst++ = base64_table[(c >> 18) & 0x3f];
        *dst++ = base64_table[(c >> 12) & 0x3f];

        if (i > (src_len + 1))
            *dst++ = padding;
        else
            *dst++ = base64_table[(c >> 6) & 0x3f];

        if (i > src_len)
            *dst++ = padding;
        else
            *dst++ = base64_table[(c >> 0) & 0x3f];
    }

    return static_cast<std::size_t>(dst - base);
}


std::string to_base64(std::string const& in)
{
    auto        b   = base64();
    std::string result(b.needed_encoded_length(in.size()), ' ');
    auto        len = b.encode(in.data(), in.size(), &result[0]);
    result.resize(len);
    return result;
}

}
