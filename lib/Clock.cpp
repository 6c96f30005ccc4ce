#include "Clock.h"
#include "Utilities.h"

namespace hr {

int64_t SystemClock::nowMs() const { return utl::getCurrentTimeMs(); }

} // namespace hr
