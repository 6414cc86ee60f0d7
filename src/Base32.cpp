#include "Base32.hpp"
#include "GeoError.hpp"
#include <array>
#include <cctype>

namespace geohash {

static constexpr int8_t NOT_IN_ALPHABET = -1;

// Indexed by byte value; lower and upper case map to the same digit.
static const std::array<int8_t, 256>& decodeTable() {
    static const std::array<int8_t, 256> table = [] {
        std::array<int8_t, 256> values;
        values.fill(NOT_IN_ALPHABET);
        for (int i = 0; i < 32; ++i) {
            unsigned char c = static_cast<unsigned char>(BASE32_ALPHABET[i]);
            values[c] = static_cast<int8_t>(i);
            values[static_cast<unsigned char>(std::toupper(c))] = static_cast<int8_t>(i);
        }
        return values;
    }();
    return table;
}

char encodeDigit(uint8_t value) {
    if (value >= 32) {
        throw InvalidArgumentError("base32 digit out of range: " + std::to_string(value));
    }
    return BASE32_ALPHABET[value];
}

uint8_t decodeChar(char c) {
    int8_t v = decodeTable()[static_cast<unsigned char>(c)];
    if (v == NOT_IN_ALPHABET) {
        throw InvalidCharacterError(c);
    }
    return static_cast<uint8_t>(v);
}

bool isValidChar(char c) {
    return decodeTable()[static_cast<unsigned char>(c)] != NOT_IN_ALPHABET;
}

}
