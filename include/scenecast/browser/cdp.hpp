#pragma once

#include "scenecast/common/result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace scenecast::browser {

// Flat view of a CDP result object. Nested objects and arrays are kept as raw JSON.
using JsonMap = std::unordered_map<std::string, std::string>;
using EventCallback = std::function<void(const std::string &session_id, const JsonMap &params)>;

class ICDPTransport {
public:
  virtual ~ICDPTransport() = default;
  [[nodiscard]] virtual common::Status connect(const std::string &url) = 0;
  virtual void close() = 0;
  [[nodiscard]] virtual bool is_connected() const = 0;
  [[nodiscard]] virtual common::Status send_text(const std::string &payload) = 0;
  [[nodiscard]] virtual common::Result<std::string>
  receive_text(std::chrono::milliseconds timeout) = 0;
};

/// Minimal RFC 6455 client for ws:// endpoints exposed by the DevTools server.
class WebSocketTransport final : public ICDPTransport {
public:
  WebSocketTransport() = default;
  ~WebSocketTransport() override;

  WebSocketTransport(const WebSocketTransport &) = delete;
  WebSocketTransport &operator=(const WebSocketTransport &) = delete;

  [[nodiscard]] common::Status connect(const std::string &url) override;
  void close() override;
  [[nodiscard]] bool is_connected() const override;
  [[nodiscard]] common::Status send_text(const std::string &payload) override;
  [[nodiscard]] common::Result<std::string>
  receive_text(std::chrono::milliseconds timeout) override;

private:
  [[nodiscard]] common::Status send_frame(unsigned char opcode, const std::string &payload);
  [[nodiscard]] common::Status write_all(const std::string &data);
  [[nodiscard]] bool take_frame(unsigned char &opcode, bool &fin, std::string &payload);

  int fd_ = -1;
  std::atomic<bool> connected_{false};
  std::mutex send_mutex_;
  std::string rx_buffer_;
  std::string fragment_;
};

[[nodiscard]] std::string websocket_accept_key(const std::string &client_key);

class CDPClient {
public:
  explicit CDPClient(std::unique_ptr<ICDPTransport> transport);
  ~CDPClient();

  CDPClient(const CDPClient &) = delete;
  CDPClient &operator=(const CDPClient &) = delete;

  [[nodiscard]] common::Status connect(const std::string &ws_url);
  void disconnect();
  [[nodiscard]] bool is_connected() const;

  /// Values that look like JSON literals (numbers, booleans, objects, arrays) are sent raw.
  [[nodiscard]] common::Result<JsonMap>
  send_command(const std::string &method, const JsonMap &params = {},
               const std::string &session_id = "",
               std::chrono::milliseconds timeout = std::chrono::seconds(30));

  [[nodiscard]] common::Result<JsonMap>
  send_command_json(const std::string &method, const std::string &params_json,
                    const std::string &session_id = "",
                    std::chrono::milliseconds timeout = std::chrono::seconds(30));

  /// Callbacks run on a dedicated dispatch thread and may issue commands.
  int on_event(const std::string &method, EventCallback callback);
  void remove_event_listener(int listener_id);

  [[nodiscard]] common::Result<JsonMap> evaluate_js(const std::string &expression,
                                                    const std::string &session_id = "");
  [[nodiscard]] common::Result<std::string> capture_screenshot(const std::string &session_id = "");

  /// Responses received but not yet claimed by a waiting command.
  [[nodiscard]] std::size_t buffered_responses() const;

private:
  struct Listener {
    int id = 0;
    std::string method;
    EventCallback callback;
  };
  struct PendingEvent {
    std::string method;
    std::string session_id;
    JsonMap params;
  };

  void reader_loop();
  void dispatch_loop();
  void stop_threads();

  std::unique_ptr<ICDPTransport> transport_;
  std::atomic<int> next_id_{1};
  std::atomic<bool> running_{false};
  std::thread reader_thread_;
  std::thread dispatch_thread_;

  mutable std::mutex response_mutex_;
  std::condition_variable response_cv_;
  // Ids of commands still waiting; replies to anything else are dropped.
  std::unordered_set<int> awaiting_;
  std::unordered_map<int, std::string> responses_;

  std::mutex event_mutex_;
  std::condition_variable event_cv_;
  std::deque<PendingEvent> events_;

  std::mutex listener_mutex_;
  std::vector<Listener> listeners_;
  int next_listener_id_ = 1;
};

} // namespace scenecast::browser
