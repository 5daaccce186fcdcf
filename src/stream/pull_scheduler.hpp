#pragma once

/**
 * @file pull_scheduler.hpp
 * @brief Single-shot, cancellable rate limiter for pull-driven production
 *
 * Every consumer pull is served by exactly one scheduled task. With a zero
 * delay the task is posted to the io_context and runs on its next turn;
 * otherwise a steady timer fires after the configured delay. A task can be
 * cancelled at any point between schedule() and its execution.
 */

#include <chrono>
#include <functional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "common/lifetime_guard.hpp"
#include "common/macros.hpp"

namespace bulkstream {

class PullScheduler {
public:
  using Task = std::function<void()>;

  PullScheduler(boost::asio::io_context &io, std::chrono::milliseconds delay);

  /**
   * @brief Destructor - cancels the pending task
   */
  ~PullScheduler();

  BULKSTREAM_DISALLOW_COPY_AND_MOVE(PullScheduler);

  /**
   * @brief Schedule task to run once after the delay
   * @return false if a task is already pending (nothing scheduled)
   */
  bool schedule(Task task);

  /**
   * @brief Drop the pending task, if any; it will never run
   */
  void cancel();

  [[nodiscard]] bool pending() const noexcept { return pending_; }
  [[nodiscard]] std::chrono::milliseconds delay() const noexcept {
    return delay_;
  }

private:
  void fire(const Task &task);

  boost::asio::io_context &io_;
  std::chrono::milliseconds delay_;
  boost::asio::steady_timer timer_;
  bool pending_ = false;
  LifetimeGuard guard_;
};

} // namespace bulkstream
