#include "transfer_workers.hpp"

#include <exception>

void TransferContext::check_stop() const {
  if(stop_.load()) throw TransferInterrupted();
}

WorkerPool::WorkerPool(TransferQueue& queue,
                       std::shared_ptr<TransferProcessor> processor,
                       Options options,
                       std::shared_ptr<Logger> logger)
  : queue_(queue),
    processor_(std::move(processor)),
    options_(std::move(options)),
    logger_(std::move(logger)) {
  if(options_.workers == 0) options_.workers = 1;
}

WorkerPool::~WorkerPool() {
  stop();
}

void WorkerPool::start() {
  if(running_) return;
  running_ = true;
  stop_ = false;
  threads_.reserve(options_.workers);
  for(std::size_t i = 0; i < options_.workers; ++i) {
    threads_.emplace_back([this, i]{ worker_loop(i); });
  }
  log_info(logger_.get(), "{} pool started with {} worker(s)", options_.name, options_.workers);
}

void WorkerPool::stop() {
  if(!running_) return;
  stop_ = true;
  for(auto& t : threads_) {
    if(t.joinable()) t.join();
  }
  threads_.clear();
  running_ = false;
  log_info(logger_.get(), "{} pool stopped", options_.name);
}

void WorkerPool::worker_loop(std::size_t index) {
  auto worker_name = options_.name + "-" + std::to_string(index);
  while(!stop_.load()) {
    auto item = queue_.claim_next(options_.direction, worker_name, options_.poll_interval);
    if(!item) continue;
    if(stop_.load()) {
      queue_.release(item->queue_id);
      log_debug(logger_.get(), "{} returned {} unstarted", worker_name, item->queue_id);
      break;
    }
    log_debug(logger_.get(), "{} claimed {} (attempt {})", worker_name, item->queue_id, item->retry_count + 1);
    handle_item(*item);
    processed_.fetch_add(1);
  }
}

void WorkerPool::handle_item(const TransferItem& item) {
  TransferContext ctx(queue_, item.queue_id, stop_);
  try {
    auto outcome = processor_->process(item, ctx);
    if(outcome.failure) {
      queue_.fail(item.queue_id, *outcome.failure, outcome.error,
                  options_.max_retry_count, std::move(outcome.result));
    } else {
      queue_.complete(item.queue_id, std::move(outcome.result));
    }
  } catch(const TransferInterrupted&) {
    log_info(logger_.get(), "{} interrupted; left active for recovery", item.queue_id);
  } catch(const std::exception& e) {
    queue_.fail(item.queue_id, classify(e), e.what(), options_.max_retry_count);
  }
}
