/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// ivlab headers
#include "core/ErrorMonitor.hpp"

using namespace ivlab::core;

ErrorMonitor::Suppression::Suppression(ErrorMonitor& monitor) : monitor_(monitor) {
  std::lock_guard<std::mutex> lock(monitor_.mtx_);
  monitor_.quietThreads_.push_back(std::this_thread::get_id());
}

ErrorMonitor::Suppression::~Suppression() {
  std::lock_guard<std::mutex> lock(monitor_.mtx_);
  auto& quiet = monitor_.quietThreads_;
  const auto it = std::find(quiet.begin(), quiet.end(), std::this_thread::get_id());
  if (it != quiet.end())
    quiet.erase(it);
}

void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const std::string& message) {
  std::function<void(const std::string&)> escalate;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (std::find(quietThreads_.begin(), quietThreads_.end(), std::this_thread::get_id()) != quietThreads_.end())
      return;
    if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
      return;
    seen_.push_back(message);
    escalate = escalation_;
  }
  // called unlocked: the escalation target takes its own locks
  if (escalate)
    escalate(message);
}

void ErrorMonitor::clear() {
  std::lock_guard<std::mutex> lock(mtx_);
  seen_.clear();
}

std::size_t ErrorMonitor::failureCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return seen_.size();
}
