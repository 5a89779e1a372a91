#include "core/CrashHandler.hpp"

#include "core/Log.hpp"
#include <backward.hpp>

namespace CrashHandler {

// Lives until process exit; the handlers must outlast every other object.
static backward::SignalHandling *s_SignalHandler = nullptr;

void Init() {
  if (s_SignalHandler) {
    return;
  }
  s_SignalHandler = new backward::SignalHandling();
  if (s_SignalHandler->loaded()) {
    LOG_DEBUG("Crash handler installed");
  } else {
    LOG_WARN("Crash handler could not install signal handlers");
  }
}

} // namespace CrashHandler
