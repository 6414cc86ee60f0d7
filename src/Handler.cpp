#include "Handler.hpp"
#include "GeoError.hpp"
#include "Resp.hpp"
#include <sys/socket.h>
#include <iostream>

Handler::Handler(int client_fd, const ServerConfig& config)
    : client_fd(client_fd), verbose(config.verbose),
      geoHandler(config.defaultPrecision) {}

void Handler::handleMessage(const std::string& message) {
    pending += message;

    size_t offset = 0;
    try {
        while (offset < pending.size()) {
            auto parsed = parser.tryParse(std::string_view(pending).substr(offset));
            if (!parsed) break;

            offset += parsed->second;
            sendResponse(executeCommand(parsed->first));
        }
        pending.erase(0, offset);
    } catch (const std::runtime_error& e) {
        std::cerr << "Client " << client_fd << ": " << e.what() << "\n";
        sendResponse(resp::error("ERR", e.what()));
        pending.clear();
    }
}

std::string Handler::executeCommand(const Command& cmd) {
    if (verbose) {
        std::cout << "Client " << client_fd << ": " << cmd.name;
        for (const auto& arg : cmd.args) std::cout << " " << arg;
        std::cout << "\n";
    }

    try {
        if (cmd.name == "PING") {
            if (cmd.args.empty()) return resp::simpleString("PONG");
            return resp::bulkString(cmd.args[0]);
        } else if (cmd.name == "ECHO") {
            if (cmd.args.size() != 1) return resp::error("ERR", "ECHO requires an argument");
            return resp::bulkString(cmd.args[0]);
        } else if (geoHandler.isGeoCommand(cmd.name)) {
            return geoHandler.handleCommand(cmd.name, cmd.args);
        }
        return resp::error("ERR", "unknown command '" + cmd.name + "'");
    } catch (const InvalidCharacterError& e) {
        return resp::error("INVALIDCHAR", e.what());
    } catch (const std::exception& e) {
        return resp::error("ERR", e.what());
    }
}

void Handler::sendResponse(const std::string& response) {
    if (client_fd < 0) {
        return;
    }
    size_t total = 0;
    while (total < response.size()) {
        ssize_t sent = send(client_fd, response.data() + total, response.size() - total, MSG_NOSIGNAL);
        if (sent <= 0) {
            std::cerr << "Client " << client_fd << ": send failed\n";
            break;
        }
        total += static_cast<size_t>(sent);
    }
}
