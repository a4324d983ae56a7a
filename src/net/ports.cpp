#include "scenecast/net/ports.hpp"

#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace scenecast::net {

common::Result<std::uint16_t> find_free_port() {
  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return common::Result<std::uint16_t>::failure("failed to create socket");
  }
  struct sockaddr_in addr {};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  if (bind(fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) < 0) {
    close(fd);
    return common::Result<std::uint16_t>::failure("failed to bind an ephemeral port");
  }
  socklen_t len = sizeof(addr);
  if (getsockname(fd, reinterpret_cast<struct sockaddr *>(&addr), &len) < 0) {
    close(fd);
    return common::Result<std::uint16_t>::failure("failed to read the bound port");
  }
  close(fd);
  return common::Result<std::uint16_t>::success(ntohs(addr.sin_port));
}

common::Status wait_for_port(const std::string &host, std::uint16_t port,
                             std::chrono::milliseconds timeout) {
  struct sockaddr_in addr {};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (inet_pton(AF_INET, host == "localhost" ? "127.0.0.1" : host.c_str(), &addr.sin_addr) != 1) {
    return common::Status::error("invalid IPv4 host: " + host);
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    const int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd >= 0) {
      const bool connected =
          connect(fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) == 0;
      close(fd);
      if (connected) {
        return common::Status::success();
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  return common::Status::error("timed out waiting for " + host + ":" + std::to_string(port));
}

} // namespace scenecast::net
