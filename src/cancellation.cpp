#include "cancellation.hpp"

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancellationToken::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  if(cancelled_) return false;
  cv_.wait_for(lock, duration, [this]{ return cancelled_; });
  return !cancelled_;
}

void CancellationToken::pause(std::chrono::milliseconds duration) {
  if(!wait_for(duration)) throw OperationCancelled();
}

void CancellationToken::throw_if_cancelled() const {
  if(cancelled()) throw OperationCancelled();
}
