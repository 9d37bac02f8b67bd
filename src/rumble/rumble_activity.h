// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_RUMBLE_ACTIVITY_H
#define RUMBLE_RUMBLE_ACTIVITY_H

#include <functional>
#include <map>
#include <set>
#include <stdint.h>
#include <string>
#include <vector>

/**
 * Activity boundary
 *
 * The activity signal comes from an external model. The round engine only
 * sees its output: one evaluation per participant, either a score or a
 * "filtered" verdict that zeroes the participant's activity contribution.
 */

struct ActivityEvaluation
{
    uint32_t score;
    bool fFiltered;

    ActivityEvaluation() : score(0), fFiltered(false) {}
    ActivityEvaluation(uint32_t scoreIn, bool fFilteredIn) : score(scoreIn), fFiltered(fFilteredIn) {}
};

typedef std::map<std::string, ActivityEvaluation> ActivityScoreMap;

/** Injected activity source: participant ids in, evaluations out. Must be pure. */
typedef std::function<ActivityScoreMap(const std::vector<std::string>&)> ActivityScoreFn;

/** One recorded trade of a participant */
struct ActivityTrade
{
    uint64_t buy_volume;
    uint64_t sell_volume;
};

/** Raw model output for one participant, before anomaly filtering */
struct ActivitySample
{
    uint32_t score;
    std::vector<ActivityTrade> trades;
};

/** Summed buy+sell volume over all trades, saturating at UINT64_MAX */
uint64_t GetTotalVolume(const ActivitySample& sample);

/** A sample is anomalous when its total volume exceeds nThreshold */
bool IsAnomalousActivity(const ActivitySample& sample, uint64_t nThreshold);

/**
 * FilterAnomalousActivity - Turn raw samples into evaluations
 *
 * Anomalous participants are reported with score 0 and fFiltered set.
 */
ActivityScoreMap FilterAnomalousActivity(const std::map<std::string, ActivitySample>& samples, uint64_t nThreshold);

/**
 * MakeSampledActivitySource - Activity source backed by a fixed sample set
 *
 * Returns evaluations only for requested ids present in samples.
 */
ActivityScoreFn MakeSampledActivitySource(const std::map<std::string, ActivitySample>& samples, uint64_t nThreshold);

/** Build evaluations from plain scores, marking ids in setFiltered as filtered */
ActivityScoreMap MakeActivityScores(const std::map<std::string, uint32_t>& scores, const std::set<std::string>& setFiltered);

#endif // RUMBLE_RUMBLE_ACTIVITY_H
