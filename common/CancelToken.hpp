#pragma once

#include <atomic>

namespace netscout::common
{
    // Cooperative cancellation flag. Probing code only looks at it between
    // batches, so a request never interrupts a probe already in flight.
    class CancelToken
    {
    public:
        void RequestCancel() { m_cancelled.store(true, std::memory_order_seq_cst); }
        void Clear() { m_cancelled.store(false, std::memory_order_seq_cst); }
        bool IsCancelled() const { return m_cancelled.load(std::memory_order_relaxed); }

        static CancelToken &Global()
        {
            static CancelToken instance;
            return instance;
        }

    private:
        std::atomic<bool> m_cancelled{false};
    };

    inline void RequestScanCancel() { CancelToken::Global().RequestCancel(); }
    inline void ClearScanCancel() { CancelToken::Global().Clear(); }
    inline bool IsScanCancelled() { return CancelToken::Global().IsCancelled(); }
}
