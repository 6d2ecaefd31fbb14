// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOWBIT_SRC_UTILS_PARALLEL_H
#define LOWBIT_SRC_UTILS_PARALLEL_H

#include <functional>

namespace lowbit {

/**
 * @brief Execution resources for a host kernel launch.
 *
 * Plays the role a stream plays for device kernels: every codec and optimizer
 * entry point takes one, and the result never depends on its value.
 */
struct ExecContext {
    int NumThreads = 1;
};

/**
 * @brief Runs @p fn over `[0, num_blocks)` split into contiguous ranges, one per worker.
 *
 * The calling thread takes the first range. Blocks are independent, so the split only
 * affects scheduling, never results. If a worker throws, the first exception is rethrown
 * after all workers have been joined. If a worker thread cannot be started, the ones already
 * running are joined before the std::system_error propagates.
 *
 * @param num_blocks Number of blocks to process.
 * @param ctx Execution context; NumThreads <= 1 runs everything inline.
 * @param fn Callback receiving a half-open block range `[begin, end)`.
 */
void parallel_for_blocks(long num_blocks, const ExecContext& ctx, const std::function<void(long begin, long end)>& fn);

} // namespace lowbit

#endif //LOWBIT_SRC_UTILS_PARALLEL_H
