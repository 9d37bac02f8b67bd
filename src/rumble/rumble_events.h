// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_RUMBLE_EVENTS_H
#define RUMBLE_RUMBLE_EVENTS_H

#include "amount.h"
#include "rumble/rumble_round.h"
#include "uint256.h"

#include <stdint.h>
#include <string>
#include <vector>

enum class RumbleEventType
{
    ROUND_INITIALIZED,
    DEPOSIT_MADE,
    ACTIVITY_EVALUATED,
    ROUND_SETTLED,
    ROUND_RESET,
};

/**
 * RumbleEvent - Notification record produced by a successful operation
 *
 * Operations return their events alongside the new round; nothing is
 * delivered from inside the state machine. Only the fields relevant to the
 * event type are filled:
 * - round.initialized:  round_number, close_time
 * - deposit.made:       participant, amount, total_pool
 * - activity.evaluated: count (records updated), filtered_count
 * - round.settled:      winners, payout_pool, payout_per_winner, payout_dust,
 *                       burn_amount
 * - round.reset:        round_number
 *
 * nTime is always the time the operation ran.
 */
struct RumbleEvent
{
    RumbleEventType type;
    uint256 round_id;
    std::string participant;
    CAmount amount;
    CAmount total_pool;
    CAmount payout_pool;
    CAmount payout_per_winner;
    CAmount payout_dust;
    CAmount burn_amount;
    uint32_t count;
    uint32_t filtered_count;
    uint32_t round_number;
    int64_t nTime;
    int64_t close_time;
    std::vector<WinnerRecord> winners;

    RumbleEvent(RumbleEventType typeIn, const uint256& round_idIn)
        : type(typeIn), round_id(round_idIn), amount(0), total_pool(0), payout_pool(0),
          payout_per_winner(0), payout_dust(0), burn_amount(0), count(0), filtered_count(0),
          round_number(0), nTime(0), close_time(0) {}

    /** Value handed to the burn transfer: burn_amount plus payout_dust */
    CAmount GetBurnedTotal() const { return burn_amount + payout_dust; }

    /** Dotted event name ("deposit.made", ...) */
    std::string GetName() const;
    std::string ToString() const;
};

typedef std::vector<RumbleEvent> RumbleEvents;

/**
 * CRumbleNotifier - Outbound notification sink
 *
 * Delivery is fire-and-forget: a false return or an exception is logged by
 * DispatchEvents and never affects round state.
 */
class CRumbleNotifier
{
public:
    virtual ~CRumbleNotifier() {}
    virtual bool Notify(const RumbleEvent& event) = 0;
};

/** Notifier writing every event to the debug log under the rumble category */
class CLogNotifier : public CRumbleNotifier
{
public:
    bool Notify(const RumbleEvent& event) override;
};

/**
 * DispatchEvents - Deliver events in order to a notifier
 *
 * @return number of events delivered successfully
 */
size_t DispatchEvents(CRumbleNotifier& notifier, const RumbleEvents& events);

#endif // RUMBLE_RUMBLE_EVENTS_H
