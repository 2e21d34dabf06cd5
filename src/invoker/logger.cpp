#include <invoker/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// the mutex shared by every console sink of spdlog
using ConsoleMutex = spdlog::details::console_mutex;

void Prepare() {
  ConsoleMutex::mutex().lock();
}

void Child() {
  ConsoleMutex::mutex().unlock();
}

void Parent() {
  ConsoleMutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::set_pattern("[%t] %+");
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Parent, Child);
}
