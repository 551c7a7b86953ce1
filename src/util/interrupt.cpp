#include "mbox_nav/interrupt.hpp"
#include <csignal>
#include <signal.h>

namespace mn {

namespace {
volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void on_sigint(int) { g_interrupted = 1; }
}

bool interrupt_requested() noexcept { return g_interrupted != 0; }
void request_interrupt() noexcept { g_interrupted = 1; }
void clear_interrupt() noexcept { g_interrupted = 0; }

struct InterruptGuard::Impl {
  struct sigaction previous{};
  bool installed{false};
};

InterruptGuard::InterruptGuard() : p_(new Impl) {
  struct sigaction sa{};
  sa.sa_handler = on_sigint;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;   // no SA_RESTART: a blocked read returns EINTR
  p_->installed = (::sigaction(SIGINT, &sa, &p_->previous) == 0);
}

InterruptGuard::~InterruptGuard() {
  if (p_->installed) ::sigaction(SIGINT, &p_->previous, nullptr);
  delete p_;
}

}
