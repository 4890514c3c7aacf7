#pragma once

#include <cstddef>

namespace cryptorand::crypto::processor_id {

/**
 * Number of logical processors, at least 1
 */
size_t logical_processor_count();

/**
 * Cache slot for the calling thread, in [0, slot_count)
 *
 * Derived from the processor the thread is currently running on where the
 * platform reports it, otherwise from a per-thread hash. The result is an
 * affinity hint only; any value in range is correct.
 */
size_t current_slot(size_t slot_count);

} // namespace cryptorand::crypto::processor_id
