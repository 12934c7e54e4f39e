#pragma once

// Credit ledger engine facade

#include "creditkit/common/calendar.hpp"
#include "creditkit/common/config.hpp"
#include "creditkit/common/error.hpp"
#include "creditkit/engine/orchestrator.hpp"
#include "creditkit/ledger/ledger.hpp"
#include "creditkit/storage/memory_ledger_store.hpp"
#include "creditkit/storage/sqlite_ledger_store.hpp"
