/**
 * @file schedulerpolicy.h
 * @brief Decides how many jobs to start and with how many streams each.
 */

#ifndef SCHEDULERPOLICY_H
#define SCHEDULERPOLICY_H

/**
 * @brief Outcome of one scheduling decision.
 */
struct ScheduleDecision {
    int batchSize = 0;
    int streamsPerJob = 0;

    [[nodiscard]] bool isEmpty() const { return batchSize == 0; }
    [[nodiscard]] int connections() const { return batchSize * streamsPerJob; }

    bool operator==(const ScheduleDecision &other) const {
        return batchSize == other.batchSize && streamsPerJob == other.streamsPerJob;
    }
};

/**
 * @brief Stateless scheduling policy under a fixed connection ceiling.
 *
 * batchSize * streamsPerJob never exceeds ConnectionCeiling:
 * - two or more transfers in flight: nothing to start;
 * - nothing pending: nothing to start;
 * - exactly one job in total (pending + in flight == 1): start it with
 *   two streams;
 * - otherwise: fill the free slots with single-stream jobs.
 */
class SchedulerPolicy
{
public:
    static constexpr int ConnectionCeiling = 2;

    [[nodiscard]] static ScheduleDecision decide(int pendingCount, int inFlightCount);
};

#endif // SCHEDULERPOLICY_H
