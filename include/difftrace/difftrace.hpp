#pragma once

// difftrace: versioned key-value index for differential computation
//
// Records, per key, every (value, multiplicity) change at every version of a
// partially ordered time domain. Provides point-in-time reconstruction,
// multiplicity-weighted joins between indexes, and frontier-based compaction.
//
// Namespaces: difftrace::order (Version, Antichain),
//             difftrace::trace (Collection, Index, SharedIndex),
//             difftrace::core  (errors, logging, thread pool)

#include "difftrace/core/error.hpp"
#include "difftrace/core/executor.hpp"
#include "difftrace/core/log.hpp"
#include "difftrace/order/antichain.hpp"
#include "difftrace/order/version.hpp"
#include "difftrace/trace/collection.hpp"
#include "difftrace/trace/context.hpp"
#include "difftrace/trace/index.hpp"
#include "difftrace/trace/shared_index.hpp"
#include "difftrace/trace/version_map.hpp"
