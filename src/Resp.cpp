#include "Resp.hpp"
#include <iomanip>
#include <sstream>

namespace resp {

std::string simpleString(const std::string& s) {
    return "+" + s + "\r\n";
}

std::string error(const std::string& prefix, const std::string& message) {
    std::string line = "-" + prefix + " " + message;
    // a reply line must not contain CR/LF
    for (char& c : line) {
        if (c == '\r' || c == '\n') c = ' ';
    }
    return line + "\r\n";
}

std::string bulkString(const std::string& s) {
    return "$" + std::to_string(s.size()) + "\r\n" + s + "\r\n";
}

std::string bulkArray(const std::vector<std::string>& items) {
    std::ostringstream out;
    out << "*" << items.size() << "\r\n";
    for (const auto& item : items) {
        out << "$" << item.size() << "\r\n" << item << "\r\n";
    }
    return out.str();
}

std::string formatDouble(double value) {
    std::ostringstream ss;
    ss << std::setprecision(17) << value;
    return ss.str();
}

}
