#include <scriptbox/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// Runner children only exec, but a fork taken while another thread writes to the
// console must not leave the console mutex locked in the child
void Prepare() {
  spdlog::details::console_mutex::mutex().lock();
}

void Release() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::set_pattern("[%t] %+");
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Release, Release);
}
