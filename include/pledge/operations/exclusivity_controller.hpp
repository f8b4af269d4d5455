#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "operation.hpp"

namespace pledge::operations {

// Serializes operations that share a category. Each category remembers its
// most recently added operation (the tail); a new operation depends on the
// tail of every category it names and becomes the new tail. Operations with
// no category in common stay independent.
class exclusivity_controller {
 public:
  exclusivity_controller() = default;

  exclusivity_controller(const exclusivity_controller&)                    = delete;
  auto operator=(const exclusivity_controller&) -> exclusivity_controller& = delete;

  // Must be called before op is enqueued.
  void add_operation(const std::shared_ptr<operation>& op,
                     const std::vector<std::string>& categories) {
    std::scoped_lock lock(mutex_);
    for (const auto& category : categories) {
      auto& tail = tails_[category];
      if (tail && tail != op) {
        spdlog::trace("exclusivity '{}': '{}' waits for '{}'", category, op->name(), tail->name());
        op->add_dependency(tail);
      }
      tail = op;
    }
  }

  // Releases every category whose tail is still op.
  void remove_operation(const std::shared_ptr<operation>& op,
                        const std::vector<std::string>& categories) {
    std::scoped_lock lock(mutex_);
    for (const auto& category : categories) {
      auto it = tails_.find(category);
      if (it != tails_.end() && it->second == op) {
        tails_.erase(it);
        spdlog::trace("exclusivity '{}': released by '{}'", category, op->name());
      }
    }
  }

  // Categories with an unfinished operation.
  [[nodiscard]] auto category_count() const -> std::size_t {
    std::scoped_lock lock(mutex_);
    return tails_.size();
  }

 private:
  mutable std::mutex                                          mutex_;
  std::unordered_map<std::string, std::shared_ptr<operation>> tails_;
};

}  // namespace pledge::operations
