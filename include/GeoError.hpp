#pragma once
#include <stdexcept>
#include <string>

// Shared by the geohash and geodesy namespaces, so kept at global scope
// next to the server types (Command, Handler).
enum class GeoErrorKind {
    InvalidArgument,
    InvalidCharacter
};

class GeoError : public std::runtime_error {
public:
    GeoError(GeoErrorKind kind, const std::string& message)
        : std::runtime_error(message), errorKind(kind) {}

    GeoErrorKind kind() const { return errorKind; }

private:
    GeoErrorKind errorKind;
};

// Malformed or out-of-domain input: empty geohash, bad direction code,
// precision < 1, latitude/longitude out of range.
class InvalidArgumentError : public GeoError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : GeoError(GeoErrorKind::InvalidArgument, message) {}
};

// A symbol outside the geohash alphabet.
class InvalidCharacterError : public GeoError {
public:
    explicit InvalidCharacterError(char c)
        : GeoError(GeoErrorKind::InvalidCharacter, std::string("invalid geohash character '") + c + "'"),
          character(c) {}

    char offending() const { return character; }

private:
    char character;
};
