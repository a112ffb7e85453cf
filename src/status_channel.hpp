#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "sync_types.hpp"

// Unbounded multi-producer/single-consumer queue. Senders never block; a send
// after the receiver is gone reports false and drops the value.
namespace channel_detail {

template<typename T>
struct State {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<T> queue;
  std::size_t senders = 0;
  bool receiver_alive = true;
};

} // namespace channel_detail

template<typename T>
class Sender {
public:
  explicit Sender(std::shared_ptr<channel_detail::State<T>> state)
    : state_(std::move(state)) {
    attach();
  }

  Sender(const Sender& other) : state_(other.state_) { attach(); }

  Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

  Sender& operator=(Sender other) noexcept {
    std::swap(state_, other.state_);
    return *this;
  }

  ~Sender() { detach(); }

  bool send(T value) const {
    if(!state_) return false;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if(!state_->receiver_alive) return false;
      state_->queue.push_back(std::move(value));
    }
    state_->cv.notify_one();
    return true;
  }

  bool is_closed() const {
    if(!state_) return true;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return !state_->receiver_alive;
  }

private:
  void attach() {
    if(!state_) return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->senders;
  }

  void detach() {
    if(!state_) return;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      --state_->senders;
    }
    state_->cv.notify_all();
  }

  std::shared_ptr<channel_detail::State<T>> state_;
};

template<typename T>
class Receiver {
public:
  explicit Receiver(std::shared_ptr<channel_detail::State<T>> state)
    : state_(std::move(state)) {}

  Receiver(const Receiver&) = delete;
  Receiver& operator=(const Receiver&) = delete;
  Receiver(Receiver&&) noexcept = default;
  Receiver& operator=(Receiver&& other) noexcept {
    if(this != &other) {
      close();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~Receiver() { close(); }

  std::optional<T> try_recv() {
    if(!state_) return std::nullopt;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return pop_locked();
  }

  // Waits up to `timeout`; returns nullopt on timeout or when every sender is gone
  // and the queue is empty.
  template<typename Rep, typename Period>
  std::optional<T> recv_for(std::chrono::duration<Rep, Period> timeout) {
    if(!state_) return std::nullopt;
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait_for(lock, timeout, [this]{
      return !state_->queue.empty() || state_->senders == 0;
    });
    return pop_locked();
  }

  std::vector<T> drain() {
    std::vector<T> out;
    if(!state_) return out;
    std::lock_guard<std::mutex> lock(state_->mutex);
    out.reserve(state_->queue.size());
    while(!state_->queue.empty()) {
      out.push_back(std::move(state_->queue.front()));
      state_->queue.pop_front();
    }
    return out;
  }

  bool senders_gone() const {
    if(!state_) return true;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->senders == 0;
  }

  void close() {
    if(!state_) return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->receiver_alive = false;
    state_->queue.clear();
  }

private:
  std::optional<T> pop_locked() {
    if(state_->queue.empty()) return std::nullopt;
    T value = std::move(state_->queue.front());
    state_->queue.pop_front();
    return value;
  }

  std::shared_ptr<channel_detail::State<T>> state_;
};

template<typename T>
std::pair<Sender<T>, Receiver<T>> make_channel() {
  auto state = std::make_shared<channel_detail::State<T>>();
  return {Sender<T>(state), Receiver<T>(state)};
}

using SyncSender = Sender<SyncMessage>;
using SyncReceiver = Receiver<SyncMessage>;

// Best-effort delivery: a missing observer must never abort a transfer operation.
void send_sync_status(const SyncSender& sender, SyncStatus status);
void send_sync_event(const SyncSender& sender, SyncEvent event);
