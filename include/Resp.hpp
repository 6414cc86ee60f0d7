#pragma once
#include <string>
#include <vector>

// RESP reply encoding.
namespace resp {

std::string simpleString(const std::string& s);
std::string error(const std::string& prefix, const std::string& message);
std::string bulkString(const std::string& s);
std::string bulkArray(const std::vector<std::string>& items);

// 17 significant digits, enough to round-trip a double.
std::string formatDouble(double value);

}
