#pragma once

#include "scenecast/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace scenecast::net {

/// Asks the kernel for an unused loopback TCP port.
[[nodiscard]] common::Result<std::uint16_t> find_free_port();

/// Polls until `host:port` accepts a TCP connection or the timeout elapses.
[[nodiscard]] common::Status wait_for_port(const std::string &host, std::uint16_t port,
                                           std::chrono::milliseconds timeout);

} // namespace scenecast::net
