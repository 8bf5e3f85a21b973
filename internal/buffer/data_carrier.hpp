#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "buffer_strategy.hpp"
#include "consumer.hpp"
#include "internal/observability/logging.hpp"
#include "partitioner.hpp"

namespace uplink::buffer {

/*
  One fixed-capacity FIFO lane of a DataCarrier.
*/
template <typename T>
class Channel {
 public:
  explicit Channel(std::size_t capacity) : capacity_(capacity) {
  }

  // On failure `item` is left untouched.
  bool Save(T& item, bool blocking) {
    std::unique_lock lock(mutex_);
    if (blocking) {
      not_full_.wait(lock, [&] { return closed_ || items_.size() < capacity_; });
    }
    if (closed_ || items_.size() >= capacity_) return false;

    items_.push_back(std::move(item));
    return true;
  }

  std::size_t Drain(std::vector<T>& out, std::size_t max_items) {
    std::size_t drained = 0;
    {
      std::lock_guard lock(mutex_);
      while (drained < max_items && !items_.empty()) {
        out.push_back(std::move(items_.front()));
        items_.pop_front();
        ++drained;
      }
    }
    if (drained > 0) not_full_.notify_all();
    return drained;
  }

  void Close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    not_full_.notify_all();
  }

  std::size_t Size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

 private:
  const std::size_t capacity_;

  mutable std::mutex      mutex_;
  std::condition_variable not_full_;
  std::deque<T>           items_;
  bool                    closed_ = false;
};

/*
  Bounded multi-channel buffer with a single consumer loop.

  Producers call Produce() from any thread; the overflow behaviour follows the
  configured BufferStrategy. Consume() starts one background thread that
  drains up to `max_batch_size` items per cycle and hands them to the
  registered IConsumer.

  ShutdownConsumers() is idempotent: it closes every channel (blocked
  producers return false), stops the loop, drains what is left through
  IConsumer::Consume and finally calls IConsumer::OnExit. It must not be
  called from the consumer thread itself.
*/
template <typename T>
class DataCarrier {
 public:
  DataCarrier(std::size_t channel_size, std::size_t buffer_size, BufferStrategy strategy = BufferStrategy::kBlocking,
              Partitioner partitioner = Partitioner::kProducerThread)
      : strategy_(strategy), partitioner_(partitioner), buffer_size_(buffer_size) {
    if (channel_size == 0 || buffer_size == 0) {
      throw std::invalid_argument("DataCarrier needs at least one channel of non-zero capacity");
    }
    channels_.reserve(channel_size);
    for (std::size_t i = 0; i < channel_size; ++i) {
      channels_.push_back(std::make_unique<Channel<T>>(buffer_size));
    }
  }

  ~DataCarrier() {
    ShutdownConsumers();
  }

  DataCarrier(const DataCarrier&)            = delete;
  DataCarrier& operator=(const DataCarrier&) = delete;

  void SetBufferStrategy(BufferStrategy strategy) {
    strategy_.store(strategy);
  }

  BufferStrategy GetBufferStrategy() const {
    return strategy_.load();
  }

  // Returns false when the item was not accepted; the caller owns the drop.
  bool Produce(T item) {
    return Save(item, strategy_.load() == BufferStrategy::kBlocking);
  }

  // Never blocks, whatever the configured strategy.
  bool Offer(T item) {
    return Save(item, false);
  }

  void Consume(std::shared_ptr<IConsumer<T>> consumer, std::size_t max_batch_size,
               std::chrono::milliseconds consume_cycle = std::chrono::milliseconds(20)) {
    if (!consumer) throw std::invalid_argument("DataCarrier::Consume requires a consumer");
    if (max_batch_size == 0) throw std::invalid_argument("DataCarrier::Consume requires a positive batch size");

    std::lock_guard lock(lifecycle_mutex_);
    if (stopped_.load()) throw std::logic_error("DataCarrier is shut down");
    if (consumer_) throw std::logic_error("DataCarrier already has a consumer");

    consumer_       = std::move(consumer);
    max_batch_size_ = max_batch_size;
    consume_cycle_  = consume_cycle;
    worker_         = std::thread(&DataCarrier::Run, this);
  }

  void ShutdownConsumers() {
    if (stopped_.exchange(true)) return;

    for (auto& channel : channels_) channel->Close();
    {
      std::lock_guard lock(wake_mutex_);
      stopping_ = true;
    }
    wake_cv_.notify_all();

    std::lock_guard lock(lifecycle_mutex_);
    if (worker_.joinable()) worker_.join();
  }

  bool IsShutdown() const {
    return stopped_.load();
  }

  std::size_t Size() const {
    std::size_t total = 0;
    for (const auto& channel : channels_) total += channel->Size();
    return total;
  }

  std::size_t ChannelCount() const {
    return channels_.size();
  }

  std::size_t BufferSize() const {
    return buffer_size_;
  }

 private:
  bool Save(T& item, bool blocking) {
    if (stopped_.load()) return false;

    auto& channel = *channels_[SelectChannel(partitioner_, channels_.size(), rolling_index_)];
    if (!channel.Save(item, blocking)) return false;

    {
      std::lock_guard lock(wake_mutex_);
      signaled_ = true;
    }
    wake_cv_.notify_one();
    return true;
  }

  // Round-robin over the channels so a busy one cannot starve the rest.
  void DrainInto(std::vector<T>& batch) {
    const auto count = channels_.size();
    for (std::size_t visited = 0; visited < count && batch.size() < max_batch_size_; ++visited) {
      auto& channel = *channels_[(drain_start_ + visited) % count];
      channel.Drain(batch, max_batch_size_ - batch.size());
    }
    drain_start_ = (drain_start_ + 1) % count;
  }

  void Dispatch(std::vector<T>& batch) {
    try {
      consumer_->Consume(batch);
    } catch (const std::exception& e) {
      try {
        consumer_->OnError(batch, e);
      } catch (const std::exception& inner) {
        UPLINK_LOG_ERROR("Consumer error hook failed", {observability::StringField("error", inner.what())});
      }
    }
  }

  void Run() {
    try {
      consumer_->Init();
    } catch (const std::exception& e) {
      UPLINK_LOG_ERROR("Consumer init failed", {observability::StringField("error", e.what())});
    }

    std::vector<T> batch;
    batch.reserve(max_batch_size_);

    for (;;) {
      {
        std::lock_guard lock(wake_mutex_);
        if (stopping_) break;
        signaled_ = false;
      }

      batch.clear();
      DrainInto(batch);
      if (!batch.empty()) {
        Dispatch(batch);
        continue;
      }

      std::unique_lock lock(wake_mutex_);
      wake_cv_.wait_for(lock, consume_cycle_, [&] { return stopping_ || signaled_; });
    }

    // channels are closed by now, so this terminates
    for (;;) {
      batch.clear();
      DrainInto(batch);
      if (batch.empty()) break;
      Dispatch(batch);
    }

    try {
      consumer_->OnExit();
    } catch (const std::exception& e) {
      UPLINK_LOG_ERROR("Consumer exit hook failed", {observability::StringField("error", e.what())});
    }
  }

  std::vector<std::unique_ptr<Channel<T>>> channels_;
  std::atomic<BufferStrategy>              strategy_;
  const Partitioner                        partitioner_;
  const std::size_t                        buffer_size_;
  std::atomic<std::size_t>                 rolling_index_{0};

  std::mutex                       lifecycle_mutex_;
  std::shared_ptr<IConsumer<T>>    consumer_;
  std::size_t                      max_batch_size_ = 1;
  std::chrono::milliseconds        consume_cycle_{20};
  std::size_t                      drain_start_ = 0;
  std::thread                      worker_;
  std::atomic<bool>                stopped_{false};

  std::mutex              wake_mutex_;
  std::condition_variable wake_cv_;
  bool                    signaled_ = false;
  bool                    stopping_ = false;
};

} // namespace uplink::buffer
