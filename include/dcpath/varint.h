#ifndef DCPATH_VARINT_H
#define DCPATH_VARINT_H

#include <dcpath/config.h>
#include <dcpath/result.h>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace dcpath {

/**
 * QUIC variable-length integer codec (RFC 9000 section 16).
 *
 * The two most significant bits of the first byte select a 1, 2, 4 or 8
 * byte encoding, leaving 62 usable bits.
 */
constexpr uint64_t VARINT_MAX = (uint64_t{1} << 62) - 1;

DCPATH_API size_t varint_size(uint64_t value);

/**
 * Append the shortest encoding of value to out.
 * @throws DCException(INVALID_PARAMETER) if value exceeds VARINT_MAX
 */
DCPATH_API void encode_varint(std::vector<uint8_t>& out, uint64_t value);

/**
 * Decode a varint starting at offset, advancing offset past it.
 *
 * Longer than necessary encodings are accepted as RFC 9000 section 16
 * permits; the value is the same and offset advances by the encoded length.
 * @return DECODE_ERROR when the buffer ends inside the integer
 */
DCPATH_API Result<uint64_t> decode_varint(const uint8_t* data, size_t length, size_t& offset);

} // namespace dcpath

#endif // DCPATH_VARINT_H
