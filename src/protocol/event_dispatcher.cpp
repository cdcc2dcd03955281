// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "protocol/event_dispatcher.hpp"
#include "protocol/event.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace draftops {
namespace protocol {

void EventDispatcher::RegisterHandler(const std::string& command,
                                      EventHandler handler) {
  if (command.empty()) {
    LOG_PROTO_WARN("Attempted to register handler for empty command");
    return;
  }

  if (!handler) {
    LOG_PROTO_ERROR("Attempted to register empty handler for command: {}", command);
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  handlers_[command] = std::move(handler);
  LOG_PROTO_DEBUG("Registered handler for command: {}", command);
}

void EventDispatcher::UnregisterHandler(const std::string& command) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handlers_.erase(command) > 0) {
    LOG_PROTO_DEBUG("Unregistered handler for command: {}", command);
  }
}

bool EventDispatcher::Dispatch(const Event& event) {
  const std::string command = event.command();

  // Copy the handler out so it runs without the registry lock held
  EventHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
      LOG_PROTO_TRACE("No handler for command: {}", command);
      return false;
    }
    handler = it->second;
  }

  try {
    return handler(event);
  } catch (const std::exception& e) {
    LOG_PROTO_ERROR("Handler exception for command {}: {}", command, e.what());
    return false;
  }
}

bool EventDispatcher::HasHandler(const std::string& command) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.count(command) > 0;
}

std::vector<std::string> EventDispatcher::GetRegisteredCommands() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  result.reserve(handlers_.size());
  for (const auto& [cmd, _] : handlers_) {
    result.push_back(cmd);
  }
  std::sort(result.begin(), result.end());
  return result;
}

} // namespace protocol
} // namespace draftops
