#pragma once
#include <optional>
#include <string_view>
#include <string>
#include <utility>
#include <vector>

struct Command {
    std::string name;   // upper-cased
    std::vector<std::string> args;
};

class Parser {
public:
    // Parses the first request in input: a RESP array of bulk strings, or an
    // inline command terminated by "\r\n" or "\n". Returns the command and the
    // number of bytes it used, or nullopt when the request is not complete yet.
    // Throws std::runtime_error on malformed input.
    std::optional<std::pair<Command, size_t>> tryParse(std::string_view input);

private:
    std::optional<std::pair<int, size_t>> extractCount(std::string_view str);
    std::optional<std::pair<Command, size_t>> parseArray(std::string_view input);
    std::optional<std::pair<Command, size_t>> parseInline(std::string_view input);
    Command makeCommand(std::vector<std::string>&& parts);
};
