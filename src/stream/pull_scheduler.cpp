/**
 * @file pull_scheduler.cpp
 * @brief Pull scheduler implementation
 */

#include "stream/pull_scheduler.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

namespace bulkstream {

PullScheduler::PullScheduler(boost::asio::io_context &io,
                             std::chrono::milliseconds delay)
    : io_(io), delay_(delay), timer_(io) {}

PullScheduler::~PullScheduler() { cancel(); }

bool PullScheduler::schedule(Task task) {
  if (pending_) {
    return false;
  }
  pending_ = true;

  if (delay_.count() == 0) {
    boost::asio::post(io_, guard_.bind([this, task = std::move(task)]() {
      fire(task);
    }));
    return true;
  }

  timer_.expires_after(delay_);
  timer_.async_wait(guard_.bind(
      [this, task = std::move(task)](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        fire(task);
      }));
  return true;
}

void PullScheduler::cancel() {
  if (!pending_) {
    return;
  }
  pending_ = false;
  // Posted tasks cannot be recalled; expiring the guard disarms them
  guard_.reset();
  timer_.cancel();
}

void PullScheduler::fire(const Task &task) {
  pending_ = false;
  task();
}

} // namespace bulkstream
