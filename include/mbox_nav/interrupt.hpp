#pragma once

namespace mn {

// Process-wide cancellation flag raised by SIGINT while an
// InterruptGuard is alive. Long loops poll interrupt_requested() between
// records and unwind normally, so scoped files and locks are released.
bool interrupt_requested() noexcept;
void request_interrupt() noexcept;
void clear_interrupt() noexcept;

// Installs the SIGINT handler; restores the previous one on destruction.
class InterruptGuard {
public:
  InterruptGuard();
  ~InterruptGuard();

  InterruptGuard(const InterruptGuard&) = delete;
  InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
  struct Impl; Impl* p_;
};

}
