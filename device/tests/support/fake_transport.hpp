#pragma once

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "iothub/transport.hpp"

namespace iothub::test_support {

struct PublishedMessage {
  std::string topic;
  std::optional<std::string> payload;
};

// 발행/구독을 기록하고, 주입된 메시지를 predicate/핸들러 계약대로 전달하는 테스트용 전송 계층.
class FakeTransport : public MqttTransport {
 public:
  using PublishHook = std::function<void(const PublishedMessage&)>;

  void SetCredentials(const std::string& username, const std::string& password) override {
    std::lock_guard<std::mutex> lock(mutex_);
    username_ = username;
    passwords_.push_back(password);
  }

  void Connect(const ConnectOptions& options, ReconnectHook on_reconnect) override {
    std::lock_guard<std::mutex> lock(mutex_);
    connect_options_ = options;
    reconnect_hook_ = std::move(on_reconnect);
    ++connect_count_;
  }

  void Subscribe(const std::vector<TopicFilter>& filters) override {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.insert(subscriptions_.end(), filters.begin(), filters.end());
  }

  void Publish(const std::string& topic, const std::optional<std::string>& payload) override {
    PublishHook hook;
    PublishedMessage message{topic, payload};
    {
      std::lock_guard<std::mutex> lock(mutex_);
      published_.push_back(message);
      hook = publish_hook_;
    }
    if (hook) {
      hook(message);
    }
  }

  HandlerId On(TransportEvent /*event*/, MessageHandler handler, MessagePredicate predicate) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_handler_id_++;
    handlers_.push_back({id, std::move(handler), std::move(predicate)});
    return id;
  }

  void Off(HandlerId id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(std::remove_if(handlers_.begin(), handlers_.end(),
                                   [id](const Registration& registration) { return registration.id == id; }),
                    handlers_.end());
  }

  void ClearReconnectHook() override {
    std::lock_guard<std::mutex> lock(mutex_);
    reconnect_hook_ = nullptr;
  }

  // Stop()이 호출되고 수신함이 빌 때까지 메시지를 전달한다. 핸들러 예외는 errors()에 모은다.
  void Loop() override {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
      inbox_cv_.wait(lock, [this]() { return stopped_ || !inbox_.empty(); });
      if (inbox_.empty()) {
        return;
      }
      auto message = inbox_.front();
      inbox_.pop_front();
      lock.unlock();
      try {
        Deliver(message);
      } catch (const std::exception&) {
        std::lock_guard<std::mutex> error_lock(mutex_);
        errors_.push_back(std::current_exception());
      }
      lock.lock();
    }
  }

  void Deliver(const MqttMessage& message) {
    std::vector<Registration> handlers;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      handlers = handlers_;
    }
    for (const auto& registration : handlers) {
      if (!IsRegistered(registration.id)) {
        continue;
      }
      if (registration.predicate(message)) {
        registration.handler(message);
      }
    }
  }

  void Enqueue(const MqttMessage& message) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      inbox_.push_back(message);
    }
    inbox_cv_.notify_all();
  }

  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = true;
    }
    inbox_cv_.notify_all();
  }

  void SimulateReconnect() {
    ReconnectHook hook;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      hook = reconnect_hook_;
    }
    if (hook) {
      hook();
    }
  }

  void SetPublishHook(PublishHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    publish_hook_ = std::move(hook);
  }

  std::vector<PublishedMessage> published() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
  }

  std::vector<TopicFilter> subscriptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_;
  }

  std::vector<std::string> passwords() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return passwords_;
  }

  std::string username() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return username_;
  }

  ConnectOptions connect_options() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connect_options_;
  }

  int connect_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connect_count_;
  }

  std::size_t handler_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
  }

  bool has_reconnect_hook() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(reconnect_hook_);
  }

  std::vector<std::exception_ptr> errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
  }

 private:
  struct Registration {
    HandlerId id;
    MessageHandler handler;
    MessagePredicate predicate;
  };

  bool IsRegistered(HandlerId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(handlers_.begin(), handlers_.end(),
                       [id](const Registration& registration) { return registration.id == id; });
  }

  mutable std::mutex mutex_;
  std::condition_variable inbox_cv_;
  std::deque<MqttMessage> inbox_;
  bool stopped_{false};
  std::string username_;
  std::vector<std::string> passwords_;
  ConnectOptions connect_options_;
  ReconnectHook reconnect_hook_;
  int connect_count_{0};
  std::vector<TopicFilter> subscriptions_;
  std::vector<PublishedMessage> published_;
  std::vector<Registration> handlers_;
  HandlerId next_handler_id_{1};
  std::vector<std::exception_ptr> errors_;
  PublishHook publish_hook_;
};

}  // namespace iothub::test_support
