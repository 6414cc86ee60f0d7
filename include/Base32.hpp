#pragma once
#include <cstdint>

namespace geohash {

constexpr char BASE32_ALPHABET[] = "0123456789bcdefghjkmnpqrstuvwxyz";
constexpr int BASE32_BITS = 5;

// Value 0..31 to its alphabet symbol. Throws InvalidArgumentError when out of range.
char encodeDigit(uint8_t value);

// Alphabet symbol to its 5-bit value. Upper case is accepted.
// Throws InvalidCharacterError for 'a', 'i', 'l', 'o' and anything outside the alphabet.
uint8_t decodeChar(char c);

bool isValidChar(char c);

}
