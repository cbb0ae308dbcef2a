#include <ferris/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// Sandbox tasks are forked from arbitrary threads; a console mutex held by
// another thread at fork time would stay locked forever in the child.
using console_mutex = spdlog::details::console_mutex;

void Prepare() {
  console_mutex::mutex().lock();
}

void Release() {
  console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Release, Release);
}
