#include "otelpipe/signal_handler.h"

#include <pthread.h>

#include <csignal>
#include <cstring>
#include <system_error>
#include <thread>

#include "otelpipe/observability/logging.h"

namespace otelpipe {

void SignalHandler::Install(StopSource source) {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);

  if (const int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr); rc != 0) {
    throw std::system_error(rc, std::generic_category(), "pthread_sigmask");
  }

  std::thread([set, source = std::move(source)] {
    int signal = 0;
    if (sigwait(&set, &signal) != 0) {
      return;
    }
    OP_LOG_INFO_FMT("received signal {}, stopping", strsignal(signal));
    source.request_stop();
  }).detach();
}

}  // namespace otelpipe
