// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace draftops {
namespace draft {

/**
 * Fixed-capacity ring of immutable snapshots, oldest evicted first.
 *
 * Logical index 0 is the oldest retained entry. ResolveIndex() also
 * accepts negative indices counted from the newest entry (-1 = newest),
 * so the valid range for N entries is [-N, N-1].
 *
 * Not thread-safe; the owner serialises access.
 */
template <typename T>
class SnapshotRing {
public:
  using Ptr = std::shared_ptr<const T>;

  explicit SnapshotRing(size_t capacity) : slots_(capacity) {}

  size_t capacity() const { return slots_.size(); }
  size_t size() const { return count_; }
  bool empty() const { return count_ == 0; }

  void push(Ptr entry) {
    if (slots_.empty()) {
      return;
    }
    if (count_ < slots_.size()) {
      slots_[(head_ + count_) % slots_.size()] = std::move(entry);
      ++count_;
    } else {
      slots_[head_] = std::move(entry);
      head_ = (head_ + 1) % slots_.size();
    }
  }

  // Map a possibly-negative index to a logical position in [0, size())
  std::optional<size_t> ResolveIndex(long long index) const {
    const auto n = static_cast<long long>(count_);
    if (index >= n || index < -n) {
      return std::nullopt;
    }
    return static_cast<size_t>(index < 0 ? n + index : index);
  }

  // Logical position, 0 = oldest. Caller guarantees pos < size().
  const Ptr &at(size_t pos) const { return slots_[(head_ + pos) % slots_.size()]; }

  // Keep the oldest new_size entries and release the rest
  void truncate(size_t new_size) {
    while (count_ > new_size) {
      slots_[(head_ + count_ - 1) % slots_.size()].reset();
      --count_;
    }
  }

  void clear() { truncate(0); head_ = 0; }

private:
  std::vector<Ptr> slots_;
  size_t head_{0};
  size_t count_{0};
};

} // namespace draft
} // namespace draftops
