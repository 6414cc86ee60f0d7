#pragma once
#include <string>
#include <vector>
#include "GeoHandler.hpp"
#include "Parser.hpp"
#include "ServerConfig.hpp"

class Handler {
    int client_fd;
    bool verbose;
    std::string pending;

    Parser parser;
    GeoHandler geoHandler;

public:
    Handler(int client_fd, const ServerConfig& config);

    // Buffers data read from the socket and answers every complete request in it.
    void handleMessage(const std::string& message);

    // Runs one command and returns its reply; failures become RESP errors.
    std::string executeCommand(const Command& cmd);

    void sendResponse(const std::string& response);
};
