#include "schedulerpolicy.h"

#include <algorithm>

ScheduleDecision SchedulerPolicy::decide(int pendingCount, int inFlightCount)
{
    const int pending = std::max(pendingCount, 0);
    const int inFlight = std::max(inFlightCount, 0);

    if (inFlight >= ConnectionCeiling || pending == 0) {
        return {};
    }

    // A lone job gets the whole budget
    if (pending + inFlight == 1) {
        return {1, ConnectionCeiling};
    }

    return {std::min(pending, ConnectionCeiling - inFlight), 1};
}
