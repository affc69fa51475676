#pragma once

#include "taxlots/records.hpp"

#include <vector>

namespace taxlots {

struct DividendRecord {
    MoneyEvent dividend;
    std::vector<MoneyEvent> withholdings;

    // Magnitude of the summed withholding amounts; refunds offset charges.
    [[nodiscard]] Decimal withheld() const;
    [[nodiscard]] Decimal gross() const { return dividend.amount; }
    [[nodiscard]] Decimal net() const { return gross() - withheld(); }
};

struct ReconciliationResult {
    std::vector<DividendRecord> records;          // one per dividend, input order
    std::vector<MoneyEvent> orphan_withholdings;  // no dividend with the same symbol and date
};

// Joins withholding entries to dividends on exact (symbol, date). A dividend
// without withholdings is valid. When several dividends share a key the
// withholdings go to the first of them, so each withholding lands in exactly
// one record or in the orphan list.
ReconciliationResult reconcile_dividends(const std::vector<MoneyEvent>& dividends,
                                         const std::vector<MoneyEvent>& withholdings);

} // namespace taxlots
