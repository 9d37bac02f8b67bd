// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rumble/rumble_activity.h"

#include "logging.h"

#include <limits>

uint64_t GetTotalVolume(const ActivitySample& sample)
{
    static const uint64_t MAX_VOLUME = std::numeric_limits<uint64_t>::max();

    uint64_t nTotal = 0;
    for (const ActivityTrade& trade : sample.trades) {
        for (uint64_t v : {trade.buy_volume, trade.sell_volume}) {
            if (nTotal > MAX_VOLUME - v)
                return MAX_VOLUME;
            nTotal += v;
        }
    }
    return nTotal;
}

bool IsAnomalousActivity(const ActivitySample& sample, uint64_t nThreshold)
{
    return GetTotalVolume(sample) > nThreshold;
}

ActivityScoreMap FilterAnomalousActivity(const std::map<std::string, ActivitySample>& samples, uint64_t nThreshold)
{
    ActivityScoreMap result;
    for (const auto& entry : samples) {
        if (IsAnomalousActivity(entry.second, nThreshold)) {
            LogPrint(BCLog::RUMBLE, "FilterAnomalousActivity: %s filtered (volume=%u threshold=%u)\n",
                     entry.first, GetTotalVolume(entry.second), nThreshold);
            result[entry.first] = ActivityEvaluation(0, true);
        } else {
            result[entry.first] = ActivityEvaluation(entry.second.score, false);
        }
    }
    return result;
}

ActivityScoreFn MakeSampledActivitySource(const std::map<std::string, ActivitySample>& samples, uint64_t nThreshold)
{
    const ActivityScoreMap evaluations = FilterAnomalousActivity(samples, nThreshold);
    return [evaluations](const std::vector<std::string>& ids) {
        ActivityScoreMap result;
        for (const std::string& id : ids) {
            auto it = evaluations.find(id);
            if (it != evaluations.end())
                result.insert(*it);
        }
        return result;
    };
}

ActivityScoreMap MakeActivityScores(const std::map<std::string, uint32_t>& scores, const std::set<std::string>& setFiltered)
{
    ActivityScoreMap result;
    for (const auto& entry : scores) {
        result[entry.first] = ActivityEvaluation(entry.second, false);
    }
    for (const std::string& id : setFiltered) {
        result[id] = ActivityEvaluation(0, true);
    }
    return result;
}
