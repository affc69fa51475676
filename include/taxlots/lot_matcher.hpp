#pragma once

#include "taxlots/records.hpp"

#include <vector>

namespace taxlots {

struct MatchResult {
    std::vector<SaleMatch> sales;       // one per sell trade, input order
    std::vector<Trade> remaining_buys;  // unconsumed lots, input order
};

// FIFO cost-basis matching.
//
// Each sell, in the order given, consumes the oldest remaining buy lots of the
// same symbol (symbols compare exactly). Buy lots are consumed in the order
// they appear in `trades`, so callers must sort chronologically beforehand.
// The caller's trades are never modified; partially consumed lots are copies
// owned by the call.
//
// Throws InsufficientLots if a sale exceeds the remaining same-symbol lots.
MatchResult match_lots(const std::vector<Trade>& trades);

} // namespace taxlots
