#include <dcpath/varint.h>

namespace dcpath {

size_t varint_size(uint64_t value) {
    if (value < (uint64_t{1} << 6)) return 1;
    if (value < (uint64_t{1} << 14)) return 2;
    if (value < (uint64_t{1} << 30)) return 4;
    return 8;
}

void encode_varint(std::vector<uint8_t>& out, uint64_t value) {
    if (value > VARINT_MAX) {
        throw DCException(DCError::INVALID_PARAMETER, "varint out of range");
    }

    size_t size = varint_size(value);
    uint8_t prefix = 0;
    switch (size) {
        case 1: prefix = 0x00; break;
        case 2: prefix = 0x40; break;
        case 4: prefix = 0x80; break;
        default: prefix = 0xC0; break;
    }

    for (size_t i = 0; i < size; ++i) {
        uint8_t byte = static_cast<uint8_t>(value >> (8 * (size - 1 - i)));
        if (i == 0) {
            byte |= prefix;
        }
        out.push_back(byte);
    }
}

Result<uint64_t> decode_varint(const uint8_t* data, size_t length, size_t& offset) {
    if (offset >= length) {
        return make_error<uint64_t>(DCError::DECODE_ERROR);
    }

    size_t size = size_t{1} << (data[offset] >> 6);
    if (length - offset < size) {
        return make_error<uint64_t>(DCError::DECODE_ERROR);
    }

    uint64_t value = data[offset] & 0x3F;
    for (size_t i = 1; i < size; ++i) {
        value = (value << 8) | data[offset + i];
    }

    offset += size;
    return make_result(value);
}

} // namespace dcpath
