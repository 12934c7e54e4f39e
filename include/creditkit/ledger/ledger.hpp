#pragma once

#include "records.hpp"
#include "transaction.hpp"

namespace creditkit::ledger {
    // Aggregates ledger headers under creditkit::ledger
}
