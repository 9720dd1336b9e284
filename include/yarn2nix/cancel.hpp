#pragma once

#include <atomic>

namespace yarn2nix {

// Raised once by the first failing reconcile task; long-running fetches
// and subprocesses poll it and give up early.
using CancelFlag = std::atomic<bool>;

inline bool is_cancelled(const CancelFlag* flag) {
    return flag != nullptr && flag->load(std::memory_order_relaxed);
}

} // namespace yarn2nix
