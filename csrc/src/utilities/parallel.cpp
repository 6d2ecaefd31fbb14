// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "parallel.h"

#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>
#include <vector>

namespace lowbit {

void parallel_for_blocks(long num_blocks, const ExecContext& ctx, const std::function<void(long begin, long end)>& fn) {
    if (num_blocks <= 0) return;

    const long workers = std::min<long>(std::max(ctx.NumThreads, 1), num_blocks);
    if (workers == 1) {
        fn(0, num_blocks);
        return;
    }

    const long per_worker = num_blocks / workers;
    const long remainder = num_blocks % workers;
    auto range_begin = [&](long w) {
        return w * per_worker + std::min(w, remainder);
    };

    std::vector<std::exception_ptr> errors(workers);
    std::vector<std::thread> threads;
    threads.reserve(workers - 1);
    try {
        for (long w = 1; w < workers; ++w) {
            threads.emplace_back([&, w]() {
                try {
                    fn(range_begin(w), range_begin(w + 1));
                } catch (...) {
                    errors[w] = std::current_exception();
                }
            });
        }
    } catch (const std::system_error&) {
        // started workers still reference this frame
        for (auto& t : threads) {
            t.join();
        }
        throw;
    }

    try {
        fn(range_begin(0), range_begin(1));
    } catch (...) {
        errors[0] = std::current_exception();
    }

    for (auto& t : threads) {
        t.join();
    }
    for (auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
}

} // namespace lowbit
