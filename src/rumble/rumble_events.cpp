// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rumble/rumble_events.h"

#include "logging.h"

#include <exception>

std::string RumbleEvent::GetName() const
{
    switch (type) {
    case RumbleEventType::ROUND_INITIALIZED:  return "round.initialized";
    case RumbleEventType::DEPOSIT_MADE:       return "deposit.made";
    case RumbleEventType::ACTIVITY_EVALUATED: return "activity.evaluated";
    case RumbleEventType::ROUND_SETTLED:      return "round.settled";
    case RumbleEventType::ROUND_RESET:        return "round.reset";
    }
    return "unknown";
}

std::string RumbleEvent::ToString() const
{
    switch (type) {
    case RumbleEventType::ROUND_INITIALIZED:
        return strprintf("%s round=%s number=%u close=%d", GetName(), round_id.ToString(), round_number, close_time);
    case RumbleEventType::DEPOSIT_MADE:
        return strprintf("%s round=%s participant=%s amount=%u pool=%u",
                         GetName(), round_id.ToString(), participant, amount, total_pool);
    case RumbleEventType::ACTIVITY_EVALUATED:
        return strprintf("%s round=%s updated=%u filtered=%u", GetName(), round_id.ToString(), count, filtered_count);
    case RumbleEventType::ROUND_SETTLED:
        return strprintf("%s round=%s winners=%u payout=%u per_winner=%u dust=%u burn=%u burned=%u",
                         GetName(), round_id.ToString(), winners.size(), payout_pool, payout_per_winner,
                         payout_dust, burn_amount, GetBurnedTotal());
    case RumbleEventType::ROUND_RESET:
        return strprintf("%s round=%s number=%u", GetName(), round_id.ToString(), round_number);
    }
    return GetName();
}

bool CLogNotifier::Notify(const RumbleEvent& event)
{
    LogPrint(BCLog::RUMBLE, "event: %s\n", event.ToString());
    return true;
}

size_t DispatchEvents(CRumbleNotifier& notifier, const RumbleEvents& events)
{
    size_t nDelivered = 0;
    for (const RumbleEvent& event : events) {
        try {
            if (notifier.Notify(event)) {
                ++nDelivered;
            } else {
                LogPrintf("Rumble: notification %s for round %s was not delivered\n",
                          event.GetName(), event.round_id.ToString());
            }
        } catch (const std::exception& e) {
            LogPrintf("Rumble: notification %s for round %s failed: %s\n",
                      event.GetName(), event.round_id.ToString(), e.what());
        }
    }
    return nDelivered;
}
