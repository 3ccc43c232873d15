#pragma once

#include "otelpipe/stop_token.h"

namespace otelpipe {

class SignalHandler {
 public:
  // Blocks SIGINT and SIGTERM in the calling thread and in every thread
  // started from it afterwards, then requests stop on `source` from a
  // dedicated sigwait() thread when either arrives. Call from main()
  // before any other thread is started.
  static void Install(StopSource source);
};

}  // namespace otelpipe
