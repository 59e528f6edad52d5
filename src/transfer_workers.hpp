#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "transfer_queue.hpp"
#include "transfer_types.hpp"

// What a processor reports for an item that ran to the end. A set `failure`
// means the item finished but must be marked failed (e.g. some files of a
// folder could not be recovered); `result` is stored either way.
struct ProcessOutcome {
  nlohmann::json result = nlohmann::json::object();
  std::optional<FailureKind> failure;
  std::string error;
};

// Handle a processor uses to publish progress and observe shutdown.
class TransferContext {
public:
  TransferContext(TransferQueue& queue, std::string queue_id, const std::atomic<bool>& stop)
    : queue_(queue), queue_id_(std::move(queue_id)), stop_(stop) {}

  const std::string& queue_id() const { return queue_id_; }

  void report(uint64_t bytes_done, uint64_t bytes_total) {
    queue_.update_progress(queue_id_, bytes_done, bytes_total);
  }

  bool stop_requested() const { return stop_.load(); }

  // Throws TransferInterrupted once the pool has been asked to stop.
  void check_stop() const;

private:
  TransferQueue& queue_;
  std::string queue_id_;
  const std::atomic<bool>& stop_;
};

class TransferProcessor {
public:
  virtual ~TransferProcessor() = default;

  // Runs one claimed item. Exceptions are classified by the worker loop and
  // fed back into the queue; TransferInterrupted leaves the item active.
  virtual ProcessOutcome process(const TransferItem& item, TransferContext& ctx) = 0;
};

// Fixed set of threads draining one direction of the queue.
class WorkerPool {
public:
  struct Options {
    std::string name = "worker";
    Direction direction = Direction::Upload;
    std::size_t workers = 4;
    int max_retry_count = 3;
    std::chrono::milliseconds poll_interval{500};
  };

  WorkerPool(TransferQueue& queue,
             std::shared_ptr<TransferProcessor> processor,
             Options options,
             std::shared_ptr<Logger> logger = nullptr);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void start();
  // Lets every worker finish or abandon its current item, then joins. An item
  // claimed after the stop request goes back to the queue unstarted.
  void stop();
  bool running() const { return running_; }

  uint64_t items_processed() const { return processed_.load(); }

private:
  void worker_loop(std::size_t index);
  void handle_item(const TransferItem& item);

  TransferQueue& queue_;
  std::shared_ptr<TransferProcessor> processor_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::vector<std::thread> threads_;
  std::atomic<bool> stop_{false};
  std::atomic<uint64_t> processed_{0};
  bool running_ = false;
};
