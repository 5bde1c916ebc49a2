#ifndef CANCELLATION_HPP
#define CANCELLATION_HPP

#include <atomic>

/**
 * @brief Cooperative cancellation flag shared between a caller and a walk
 *
 * Walks check it between directory entries, the delete loop between paths.
 * cancel() only stores to a lock-free atomic and may be called from a signal
 * handler.
 */
class CancellationToken {
public:
  void cancel() { m_cancelled.store(true, std::memory_order_relaxed); }
  void reset() { m_cancelled.store(false, std::memory_order_relaxed); }
  bool isCancelled() const {
    return m_cancelled.load(std::memory_order_relaxed);
  }

private:
  std::atomic<bool> m_cancelled{false};
};

inline bool cancelRequested(const CancellationToken *token) {
  return token != nullptr && token->isCancelled();
}

#endif // CANCELLATION_HPP
