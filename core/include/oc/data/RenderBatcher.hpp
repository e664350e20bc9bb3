#pragma once
#include <cstdint>
#include <functional>
#include <memory>

namespace oc {

// Coalesces render requests: at most one callback per scheduled tick.
//
// The scheduler receives the deferred task and must run it later on the
// engine thread (next frame, event-loop idle, ...). Without a scheduler the
// request stays pending until the host calls flush().
class RenderBatcher {
public:
  using Task = std::function<void()>;
  using Scheduler = std::function<void(Task)>;

  RenderBatcher();
  ~RenderBatcher();

  RenderBatcher(const RenderBatcher&) = delete;
  RenderBatcher& operator=(const RenderBatcher&) = delete;

  void setScheduler(Scheduler scheduler);
  void setOnRender(Task callback);

  void requestRender();

  // Runs the pending render now, if any. Returns true if the callback ran.
  bool flush();

  void cancel();
  void destroy();

  bool isPending() const { return pending_; }
  std::uint64_t requestCount() const { return requests_; }
  std::uint64_t renderCount() const { return renders_; }

private:
  void fire(std::uint64_t ticket);

  Scheduler scheduler_;
  Task onRender_;
  bool pending_{false};
  bool destroyed_{false};
  std::uint64_t ticket_{0};
  std::uint64_t requests_{0};
  std::uint64_t renders_{0};
  // Scheduled tasks hold a weak reference so they become no-ops after destruction.
  std::shared_ptr<RenderBatcher*> self_;
};

} // namespace oc
