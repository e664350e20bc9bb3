#include "oc/data/RenderBatcher.hpp"

#include <utility>

namespace oc {

RenderBatcher::RenderBatcher()
    : self_(std::make_shared<RenderBatcher*>(this)) {}

RenderBatcher::~RenderBatcher() { destroy(); }

void RenderBatcher::setScheduler(Scheduler scheduler) {
  scheduler_ = std::move(scheduler);
}

void RenderBatcher::setOnRender(Task callback) {
  onRender_ = std::move(callback);
}

void RenderBatcher::requestRender() {
  if (destroyed_) return;
  requests_++;
  if (pending_) return;

  pending_ = true;
  std::uint64_t ticket = ++ticket_;

  if (scheduler_) {
    std::weak_ptr<RenderBatcher*> weak = self_;
    scheduler_([weak, ticket]() {
      if (auto self = weak.lock()) (*self)->fire(ticket);
    });
  }
}

bool RenderBatcher::flush() {
  if (!pending_) return false;
  fire(ticket_);
  return true;
}

void RenderBatcher::fire(std::uint64_t ticket) {
  // A cancel() or flush() since scheduling invalidates this ticket.
  if (!pending_ || ticket != ticket_) return;
  pending_ = false;
  if (onRender_) {
    renders_++;
    onRender_();
  }
}

void RenderBatcher::cancel() {
  pending_ = false;
  ++ticket_;
}

void RenderBatcher::destroy() {
  cancel();
  destroyed_ = true;
  onRender_ = nullptr;
}

} // namespace oc
