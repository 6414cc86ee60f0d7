#include "Parser.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

static constexpr int MAX_ARRAY_LEN = 1024;
static constexpr int MAX_BULK_LEN = 64 * 1024;
static constexpr size_t MAX_INLINE_LEN = 64 * 1024;
static constexpr size_t MAX_HEADER_LEN = 32;

// "<digits>\r\n" at the start of str; returns the value and the bytes used.
std::optional<std::pair<int, size_t>> Parser::extractCount(std::string_view str) {
    size_t crlf = str.find("\r\n");
    if (crlf == std::string_view::npos) {
        if (str.size() > MAX_HEADER_LEN) {
            throw std::runtime_error("Protocol error: too big count header");
        }
        return std::nullopt;
    }
    int value = 0;
    auto res = std::from_chars(str.data(), str.data() + crlf, value);
    if (res.ec != std::errc{} || res.ptr != str.data() + crlf) {
        throw std::runtime_error("Protocol error: invalid count format");
    }
    return std::make_pair(value, crlf + 2);
}

std::optional<std::pair<Command, size_t>> Parser::parseArray(std::string_view input) {
    auto header = extractCount(input.substr(1));
    if (!header) return std::nullopt;

    auto [count, used] = *header;
    if (count < 1 || count > MAX_ARRAY_LEN) {
        throw std::runtime_error("Protocol error: invalid multibulk length");
    }
    size_t pos = 1 + used;

    std::vector<std::string> parts;
    parts.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        if (pos >= input.size()) return std::nullopt;
        if (input[pos] != '$') {
            throw std::runtime_error("Protocol error: expected '$', got '" + std::string(1, input[pos]) + "'");
        }
        auto bulkHeader = extractCount(input.substr(pos + 1));
        if (!bulkHeader) return std::nullopt;

        auto [len, headerLen] = *bulkHeader;
        if (len < 0 || len > MAX_BULK_LEN) {
            throw std::runtime_error("Protocol error: invalid bulk length");
        }
        size_t start = pos + 1 + headerLen;
        size_t end = start + static_cast<size_t>(len);
        if (input.size() < end + 2) return std::nullopt;
        if (input[end] != '\r' || input[end + 1] != '\n') {
            throw std::runtime_error("Protocol error: invalid bulk string format");
        }
        parts.emplace_back(input.substr(start, static_cast<size_t>(len)));
        pos = end + 2;
    }
    return std::make_pair(makeCommand(std::move(parts)), pos);
}

std::optional<std::pair<Command, size_t>> Parser::parseInline(std::string_view input) {
    size_t eol = input.find('\n');
    if (eol == std::string_view::npos) {
        if (input.size() > MAX_INLINE_LEN) {
            throw std::runtime_error("Protocol error: too big inline request");
        }
        return std::nullopt;
    }
    if (eol > MAX_INLINE_LEN) {
        throw std::runtime_error("Protocol error: too big inline request");
    }
    std::string_view line = input.substr(0, eol);
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    std::vector<std::string> parts;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        size_t start = i;
        while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        if (i > start) parts.emplace_back(line.substr(start, i - start));
    }
    if (parts.empty()) {
        throw std::runtime_error("Protocol error: empty inline command");
    }
    return std::make_pair(makeCommand(std::move(parts)), eol + 1);
}

Command Parser::makeCommand(std::vector<std::string>&& parts) {
    Command cmd;
    cmd.name = std::move(parts.front());
    std::transform(cmd.name.begin(), cmd.name.end(), cmd.name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    cmd.args.assign(std::make_move_iterator(parts.begin() + 1), std::make_move_iterator(parts.end()));
    return cmd;
}

std::optional<std::pair<Command, size_t>> Parser::tryParse(std::string_view input) {
    if (input.empty()) {
        return std::nullopt;
    }
    if (input[0] == '*') {
        return parseArray(input);
    }
    return parseInline(input);
}
