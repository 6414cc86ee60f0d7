#include <iostream>
#include <cstdlib>
#include <string>
#include <cstring>
#include <cerrno>
#include <cstdint>
#include <unistd.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <thread>
#include "Handler.hpp"
#include "ServerConfig.hpp"

void handleClient(int client_fd, ServerConfig config) {
  Handler handler(client_fd, config);

  char buffer[4096];
  while(true){
    ssize_t bytes_received = recv(client_fd, buffer, sizeof(buffer), 0);
    if(bytes_received<=0){
      std::cout << "Client " << client_fd << " disconnected\n";
      break;
    }

    handler.handleMessage(std::string(buffer, static_cast<size_t>(bytes_received)));
  }
  close(client_fd);
}

int main(int argc, char **argv) {
  std::cout << std::unitbuf;
  std::cerr << std::unitbuf;

  ServerConfig config;
  try {
    config = parseServerConfig(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    std::cerr << "usage: " << argv[0] << " [--port <n>] [--precision <n>] [--verbose]\n";
    return 1;
  }

  int server_fd = socket(AF_INET, SOCK_STREAM, 0);
  if (server_fd < 0) {
   std::cerr << "Failed to create server socket: " << strerror(errno) << "\n";
   return 1;
  }

  int reuse = 1;
  if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    std::cerr << "setsockopt failed: " << strerror(errno) << "\n";
    close(server_fd);
    return 1;
  }

  struct sockaddr_in server_addr;
  memset(&server_addr, 0, sizeof(server_addr));
  server_addr.sin_family = AF_INET;
  server_addr.sin_addr.s_addr = INADDR_ANY;
  server_addr.sin_port = htons(static_cast<uint16_t>(config.port));

  if (bind(server_fd, (struct sockaddr *) &server_addr, sizeof(server_addr)) != 0) {
    std::cerr << "Failed to bind to port " << config.port << ": " << strerror(errno) << "\n";
    close(server_fd);
    return 1;
  }

  int connection_backlog = 16;
  if (listen(server_fd, connection_backlog) != 0) {
    std::cerr << "listen failed: " << strerror(errno) << "\n";
    close(server_fd);
    return 1;
  }

  std::cout << "geohashd listening on port " << config.port
            << " (default precision " << config.defaultPrecision << ")\n";

  while(true){
    struct sockaddr_in client_addr;
    socklen_t client_addr_len = sizeof(client_addr);
    int client_fd = accept(server_fd, (struct sockaddr *) &client_addr, &client_addr_len);
    if (client_fd < 0) {
      std::cerr << "accept failed: " << strerror(errno) << "\n";
      continue;
    }
    std::cout << "Client " << client_fd << " connected from " << inet_ntoa(client_addr.sin_addr) << "\n";

    std::thread client(handleClient, client_fd, config);
    client.detach();
  }

  close(server_fd);

  return 0;
}
