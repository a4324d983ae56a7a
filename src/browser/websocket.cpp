#include "scenecast/browser/cdp.hpp"

#include "scenecast/common/crypto.hpp"
#include "scenecast/common/fs.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace scenecast::browser {

namespace {

constexpr const char *WEBSOCKET_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr auto HANDSHAKE_TIMEOUT = std::chrono::seconds(10);

constexpr unsigned char OPCODE_CONTINUATION = 0x0;
constexpr unsigned char OPCODE_TEXT = 0x1;
constexpr unsigned char OPCODE_BINARY = 0x2;
constexpr unsigned char OPCODE_CLOSE = 0x8;
constexpr unsigned char OPCODE_PING = 0x9;

struct WsUrl {
  std::string host;
  std::string port;
  std::string path;
};

common::Result<WsUrl> parse_ws_url(const std::string &url) {
  if (!common::starts_with(url, "ws://")) {
    return common::Result<WsUrl>::failure("unsupported websocket url: " + url);
  }
  const std::string rest = url.substr(5);
  const auto slash = rest.find('/');
  const std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
  WsUrl out;
  out.path = slash == std::string::npos ? "/" : rest.substr(slash);
  const auto colon = authority.rfind(':');
  if (colon == std::string::npos) {
    out.host = authority;
    out.port = "80";
  } else {
    out.host = authority.substr(0, colon);
    out.port = authority.substr(colon + 1);
  }
  if (out.host.empty()) {
    return common::Result<WsUrl>::failure("websocket url has no host: " + url);
  }
  return common::Result<WsUrl>::success(std::move(out));
}

bool wait_readable(int fd, std::chrono::milliseconds timeout) {
  struct pollfd pfd {};
  pfd.fd = fd;
  pfd.events = POLLIN;
  while (true) {
    const int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0 && errno == EINTR) {
      continue;
    }
    return ready > 0;
  }
}

} // namespace

std::string websocket_accept_key(const std::string &client_key) {
  return common::base64_encode(common::sha1_digest(client_key + WEBSOCKET_GUID));
}

WebSocketTransport::~WebSocketTransport() {
  close();
  if (fd_ != -1) {
    ::close(fd_);
    fd_ = -1;
  }
}

common::Status WebSocketTransport::connect(const std::string &url) {
  auto parsed = parse_ws_url(url);
  if (!parsed.ok()) {
    return common::Status::error(parsed.error());
  }
  const WsUrl &target = parsed.value();

  if (fd_ != -1) {
    ::close(fd_);
    fd_ = -1;
  }
  rx_buffer_.clear();
  fragment_.clear();

  struct addrinfo hints {};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo *results = nullptr;
  if (getaddrinfo(target.host.c_str(), target.port.c_str(), &hints, &results) != 0) {
    return common::Status::error("failed to resolve " + target.host);
  }
  for (auto *ai = results; ai != nullptr; ai = ai->ai_next) {
    const int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      fd_ = fd;
      break;
    }
    ::close(fd);
  }
  freeaddrinfo(results);
  if (fd_ == -1) {
    return common::Status::error("failed to connect to " + target.host + ":" + target.port);
  }
  const int one = 1;
  setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

  const std::string key = common::base64_encode(common::random_bytes(16));
  const std::string request = "GET " + target.path + " HTTP/1.1\r\n" + "Host: " + target.host +
                              ":" + target.port + "\r\n" +
                              "Upgrade: websocket\r\n"
                              "Connection: Upgrade\r\n"
                              "Sec-WebSocket-Key: " +
                              key +
                              "\r\n"
                              "Sec-WebSocket-Version: 13\r\n\r\n";
  auto written = write_all(request);
  if (!written.ok()) {
    return written;
  }

  std::string response;
  const auto deadline = std::chrono::steady_clock::now() + HANDSHAKE_TIMEOUT;
  std::size_t header_end = std::string::npos;
  while ((header_end = response.find("\r\n\r\n")) == std::string::npos) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0 || !wait_readable(fd_, remaining)) {
      return common::Status::error("websocket handshake timed out");
    }
    char chunk[1024];
    const ssize_t n = recv(fd_, chunk, sizeof(chunk), 0);
    if (n <= 0) {
      return common::Status::error("websocket handshake failed: connection closed");
    }
    response.append(chunk, static_cast<std::size_t>(n));
  }

  const std::string headers = response.substr(0, header_end);
  if (headers.find(" 101 ") == std::string::npos) {
    return common::Status::error("websocket upgrade rejected: " +
                                 headers.substr(0, headers.find("\r\n")));
  }
  const std::string lowered = common::to_lower(headers);
  const auto accept_pos = lowered.find("sec-websocket-accept:");
  if (accept_pos == std::string::npos) {
    return common::Status::error("websocket handshake missing accept header");
  }
  const auto line_end = headers.find("\r\n", accept_pos);
  const std::string accept = common::trim(headers.substr(
      accept_pos + 21, line_end == std::string::npos ? std::string::npos : line_end - accept_pos - 21));
  if (accept != websocket_accept_key(key)) {
    return common::Status::error("websocket accept key mismatch");
  }

  rx_buffer_ = response.substr(header_end + 4);
  connected_ = true;
  return common::Status::success();
}

void WebSocketTransport::close() {
  if (!connected_.exchange(false)) {
    return;
  }
  (void)send_frame(OPCODE_CLOSE, "");
  if (fd_ != -1) {
    shutdown(fd_, SHUT_RDWR);
  }
}

bool WebSocketTransport::is_connected() const { return connected_; }

common::Status WebSocketTransport::write_all(const std::string &data) {
  std::size_t offset = 0;
  while (offset < data.size()) {
    const ssize_t n = send(fd_, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return common::Status::error("websocket write failed: " + std::string(strerror(errno)));
    }
    offset += static_cast<std::size_t>(n);
  }
  return common::Status::success();
}

common::Status WebSocketTransport::send_frame(unsigned char opcode, const std::string &payload) {
  std::string frame;
  frame.reserve(payload.size() + 14);
  frame.push_back(static_cast<char>(0x80 | opcode));

  const std::size_t len = payload.size();
  if (len < 126) {
    frame.push_back(static_cast<char>(0x80 | len));
  } else if (len <= 0xFFFF) {
    frame.push_back(static_cast<char>(0x80 | 126));
    frame.push_back(static_cast<char>((len >> 8) & 0xFF));
    frame.push_back(static_cast<char>(len & 0xFF));
  } else {
    frame.push_back(static_cast<char>(0x80 | 127));
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<char>((static_cast<std::uint64_t>(len) >> shift) & 0xFF));
    }
  }

  const std::string mask = common::random_bytes(4);
  frame += mask;
  for (std::size_t i = 0; i < len; ++i) {
    frame.push_back(static_cast<char>(payload[i] ^ mask[i % 4]));
  }

  std::lock_guard<std::mutex> lock(send_mutex_);
  if (fd_ == -1) {
    return common::Status::error("websocket not connected");
  }
  return write_all(frame);
}

common::Status WebSocketTransport::send_text(const std::string &payload) {
  if (!connected_) {
    return common::Status::error("websocket not connected");
  }
  return send_frame(OPCODE_TEXT, payload);
}

bool WebSocketTransport::take_frame(unsigned char &opcode, bool &fin, std::string &payload) {
  if (rx_buffer_.size() < 2) {
    return false;
  }
  const auto b0 = static_cast<unsigned char>(rx_buffer_[0]);
  const auto b1 = static_cast<unsigned char>(rx_buffer_[1]);
  fin = (b0 & 0x80) != 0;
  opcode = b0 & 0x0F;
  const bool masked = (b1 & 0x80) != 0;
  std::uint64_t len = b1 & 0x7F;
  std::size_t header = 2;
  if (len == 126) {
    if (rx_buffer_.size() < 4) {
      return false;
    }
    len = (static_cast<std::uint64_t>(static_cast<unsigned char>(rx_buffer_[2])) << 8) |
          static_cast<unsigned char>(rx_buffer_[3]);
    header = 4;
  } else if (len == 127) {
    if (rx_buffer_.size() < 10) {
      return false;
    }
    len = 0;
    for (std::size_t i = 2; i < 10; ++i) {
      len = (len << 8) | static_cast<unsigned char>(rx_buffer_[i]);
    }
    header = 10;
  }
  const std::size_t mask_len = masked ? 4 : 0;
  if (rx_buffer_.size() < header + mask_len + len) {
    return false;
  }
  payload = rx_buffer_.substr(header + mask_len, static_cast<std::size_t>(len));
  if (masked) {
    for (std::size_t i = 0; i < payload.size(); ++i) {
      payload[i] = static_cast<char>(payload[i] ^ rx_buffer_[header + (i % 4)]);
    }
  }
  rx_buffer_.erase(0, header + mask_len + static_cast<std::size_t>(len));
  return true;
}

common::Result<std::string> WebSocketTransport::receive_text(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    unsigned char opcode = 0;
    bool fin = false;
    std::string payload;
    while (take_frame(opcode, fin, payload)) {
      if (opcode == OPCODE_PING) {
        (void)send_frame(0xA, payload);
        continue;
      }
      if (opcode == OPCODE_CLOSE) {
        connected_ = false;
        return common::Result<std::string>::failure("closed");
      }
      if (opcode == OPCODE_TEXT || opcode == OPCODE_BINARY || opcode == OPCODE_CONTINUATION) {
        fragment_ += payload;
        if (fin) {
          std::string message = std::move(fragment_);
          fragment_.clear();
          return common::Result<std::string>::success(std::move(message));
        }
      }
    }

    if (!connected_ || fd_ == -1) {
      return common::Result<std::string>::failure("closed");
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0 || !wait_readable(fd_, remaining)) {
      return common::Result<std::string>::failure("timeout");
    }
    char chunk[16384];
    const ssize_t n = recv(fd_, chunk, sizeof(chunk), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      connected_ = false;
      return common::Result<std::string>::failure("closed");
    }
    rx_buffer_.append(chunk, static_cast<std::size_t>(n));
  }
}

} // namespace scenecast::browser
