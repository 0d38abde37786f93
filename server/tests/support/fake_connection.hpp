#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "tugchat/session_registry.hpp"

namespace tugchat::testing {

// 받은 메시지를 기록하는 연결. closed 로 바꾸면 이후 전달은 실패한다.
class FakeConnection : public SessionConnection {
 public:
  bool Deliver(std::string message) override {
    if (closed_) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(nlohmann::json::parse(message));
    return true;
  }

  void Close() { closed_ = true; }

  std::vector<nlohmann::json> Messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
  }

  std::vector<nlohmann::json> OfType(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<nlohmann::json> found;
    for (const auto& message : messages_) {
      if (message.value("type", std::string{}) == type) {
        found.push_back(message);
      }
    }
    return found;
  }

  std::size_t CountOf(const std::string& type) const { return OfType(type).size(); }

  // 조건을 만족하는 첫 메시지를 기다린다. 시간 초과면 null.
  nlohmann::json WaitFor(const std::string& type,
                         const std::function<bool(const nlohmann::json&)>& predicate = nullptr,
                         std::chrono::milliseconds timeout = std::chrono::seconds(3)) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      for (const auto& message : OfType(type)) {
        if (!predicate || predicate(message)) {
          return message;
        }
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return nullptr;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<nlohmann::json> messages_;
  std::atomic<bool> closed_{false};
};

inline bool WaitUntil(const std::function<bool()>& condition,
                      std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return condition();
}

}  // namespace tugchat::testing
