#include "scenecast/browser/cdp.hpp"

#include "scenecast/common/json_util.hpp"

#include <cctype>
#include <iostream>
#include <sstream>

namespace scenecast::browser {

namespace {

bool looks_like_json_literal(const std::string &value) {
  if (value.empty()) {
    return false;
  }
  if (value == "true" || value == "false" || value == "null") {
    return true;
  }
  if (value.front() == '{' || value.front() == '[') {
    return true;
  }
  std::size_t pos = value.front() == '-' ? 1 : 0;
  if (pos >= value.size()) {
    return false;
  }
  bool seen_dot = false;
  for (; pos < value.size(); ++pos) {
    const char c = value[pos];
    if (c == '.' && !seen_dot) {
      seen_dot = true;
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return value.back() != '.';
}

std::string params_to_json(const JsonMap &params) {
  std::ostringstream out;
  out << '{';
  bool first = true;
  for (const auto &[key, value] : params) {
    if (!first) {
      out << ',';
    }
    first = false;
    out << '"' << common::json_escape(key) << "\":";
    if (looks_like_json_literal(value)) {
      out << value;
    } else {
      out << '"' << common::json_escape(value) << '"';
    }
  }
  out << '}';
  return out.str();
}

} // namespace

CDPClient::CDPClient(std::unique_ptr<ICDPTransport> transport)
    : transport_(std::move(transport)) {}

CDPClient::~CDPClient() { disconnect(); }

common::Status CDPClient::connect(const std::string &ws_url) {
  if (running_) {
    return common::Status::error("CDP client already connected");
  }
  auto status = transport_->connect(ws_url);
  if (!status.ok()) {
    return status;
  }
  running_ = true;
  reader_thread_ = std::thread([this] { reader_loop(); });
  dispatch_thread_ = std::thread([this] { dispatch_loop(); });
  return common::Status::success();
}

void CDPClient::disconnect() {
  if (transport_ != nullptr) {
    transport_->close();
  }
  stop_threads();
}

void CDPClient::stop_threads() {
  running_ = false;
  response_cv_.notify_all();
  event_cv_.notify_all();
  if (reader_thread_.joinable() && reader_thread_.get_id() != std::this_thread::get_id()) {
    reader_thread_.join();
  }
  if (dispatch_thread_.joinable() && dispatch_thread_.get_id() != std::this_thread::get_id()) {
    dispatch_thread_.join();
  }
}

bool CDPClient::is_connected() const { return running_ && transport_->is_connected(); }

void CDPClient::reader_loop() {
  while (running_) {
    auto message = transport_->receive_text(std::chrono::milliseconds(100));
    if (!message.ok()) {
      if (message.error() == "timeout") {
        continue;
      }
      break;
    }

    const std::string &json = message.value();
    const std::string id = common::json_get_number(json, "id");
    if (!id.empty()) {
      try {
        const int response_id = std::stoi(id);
        std::lock_guard<std::mutex> lock(response_mutex_);
        if (!awaiting_.contains(response_id)) {
          continue;
        }
        responses_[response_id] = json;
      } catch (const std::exception &) {
        continue;
      }
      response_cv_.notify_all();
      continue;
    }

    PendingEvent event;
    event.method = common::json_get_string(json, "method");
    if (event.method.empty()) {
      continue;
    }
    event.session_id = common::json_get_string(json, "sessionId");
    event.params = common::json_parse_flat(common::json_get_object(json, "params"));
    {
      std::lock_guard<std::mutex> lock(event_mutex_);
      events_.push_back(std::move(event));
    }
    event_cv_.notify_all();
  }

  running_ = false;
  response_cv_.notify_all();
  event_cv_.notify_all();
}

void CDPClient::dispatch_loop() {
  while (true) {
    PendingEvent event;
    {
      std::unique_lock<std::mutex> lock(event_mutex_);
      event_cv_.wait(lock, [&] { return !events_.empty() || !running_; });
      if (events_.empty()) {
        return;
      }
      event = std::move(events_.front());
      events_.pop_front();
    }

    std::vector<EventCallback> callbacks;
    {
      std::lock_guard<std::mutex> lock(listener_mutex_);
      for (const auto &listener : listeners_) {
        if (listener.method == event.method) {
          callbacks.push_back(listener.callback);
        }
      }
    }
    for (const auto &callback : callbacks) {
      callback(event.session_id, event.params);
    }
  }
}

common::Result<JsonMap> CDPClient::send_command(const std::string &method, const JsonMap &params,
                                                const std::string &session_id,
                                                std::chrono::milliseconds timeout) {
  return send_command_json(method, params_to_json(params), session_id, timeout);
}

common::Result<JsonMap> CDPClient::send_command_json(const std::string &method,
                                                     const std::string &params_json,
                                                     const std::string &session_id,
                                                     std::chrono::milliseconds timeout) {
  if (!running_) {
    return common::Result<JsonMap>::failure("CDP client not connected");
  }

  const int id = next_id_++;
  std::ostringstream request;
  request << R"({"id":)" << id << R"(,"method":")" << common::json_escape(method)
          << R"(","params":)" << (params_json.empty() ? "{}" : params_json);
  if (!session_id.empty()) {
    request << R"(,"sessionId":")" << common::json_escape(session_id) << '"';
  }
  request << '}';

  {
    std::lock_guard<std::mutex> lock(response_mutex_);
    awaiting_.insert(id);
  }
  auto sent = transport_->send_text(request.str());
  if (!sent.ok()) {
    std::lock_guard<std::mutex> lock(response_mutex_);
    awaiting_.erase(id);
    return common::Result<JsonMap>::failure(method + ": " + sent.error());
  }

  std::string response;
  {
    std::unique_lock<std::mutex> lock(response_mutex_);
    const bool ready = response_cv_.wait_for(
        lock, timeout, [&] { return responses_.contains(id) || !running_; });
    awaiting_.erase(id);
    if (!responses_.contains(id)) {
      return common::Result<JsonMap>::failure(
          method + (ready ? ": connection closed" : ": timed out waiting for response"));
    }
    response = std::move(responses_[id]);
    responses_.erase(id);
  }

  const std::string error = common::json_get_object(response, "error");
  if (!error.empty()) {
    return common::Result<JsonMap>::failure(method + ": " +
                                            common::json_get_string(error, "message"));
  }
  return common::Result<JsonMap>::success(
      common::json_parse_flat(common::json_get_object(response, "result")));
}

std::size_t CDPClient::buffered_responses() const {
  std::lock_guard<std::mutex> lock(response_mutex_);
  return responses_.size();
}

int CDPClient::on_event(const std::string &method, EventCallback callback) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const int id = next_listener_id_++;
  listeners_.push_back({id, method, std::move(callback)});
  return id;
}

void CDPClient::remove_event_listener(int listener_id) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  std::erase_if(listeners_, [&](const Listener &listener) { return listener.id == listener_id; });
}

common::Result<JsonMap> CDPClient::evaluate_js(const std::string &expression,
                                               const std::string &session_id) {
  const std::string params = R"({"expression":")" + common::json_escape(expression) +
                             R"(","returnByValue":true,"awaitPromise":true})";
  auto result = send_command_json("Runtime.evaluate", params, session_id);
  if (!result.ok()) {
    return result;
  }
  const auto exception = result.value().find("exceptionDetails");
  if (exception != result.value().end()) {
    std::string message = common::json_get_string(
        common::json_get_object(exception->second, "exception"), "description");
    if (message.empty()) {
      message = common::json_get_string(exception->second, "text");
    }
    return common::Result<JsonMap>::failure("evaluate failed: " + message);
  }
  return result;
}

common::Result<std::string> CDPClient::capture_screenshot(const std::string &session_id) {
  auto result = send_command("Page.captureScreenshot", {{"format", "png"}}, session_id);
  if (!result.ok()) {
    return common::Result<std::string>::failure(result.error());
  }
  const auto data = result.value().find("data");
  if (data == result.value().end()) {
    return common::Result<std::string>::failure("Page.captureScreenshot returned no data");
  }
  return common::Result<std::string>::success(data->second);
}

} // namespace scenecast::browser
