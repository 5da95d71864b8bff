// =============================================================================
// xz-blocks - Weak Cache
// =============================================================================
// Single-entry cache that never keeps its value alive on its own.
//
// The cache holds only a std::weak_ptr to the value it last produced. As long
// as any caller still owns the returned handle, later lookups return that same
// object; once every handle is released the memory is reclaimed and the next
// lookup runs the factory again.
//
// Usage:
//   WeakCache<ByteBuffer> cache;
//   auto handle = cache.getOrCompute([&] { return readPayload(); });
//
// Thread Safety:
// - All member functions are thread-safe.
// - The factory runs under the cache mutex, so concurrent callers that miss at
//   the same time share one computation.
// =============================================================================

#ifndef XZB_COMMON_WEAK_CACHE_H
#define XZB_COMMON_WEAK_CACHE_H

#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

namespace xzb {

/// @brief Non-owning, self-invalidating cache for one value.
/// @tparam T Cached value type; handed out as std::shared_ptr<const T>.
template <typename T>
class WeakCache {
public:
    /// @brief Strong handle to a cached value.
    using Handle = std::shared_ptr<const T>;

    WeakCache() = default;

    // Non-copyable, non-movable (owns a mutex)
    WeakCache(const WeakCache&) = delete;
    WeakCache& operator=(const WeakCache&) = delete;
    WeakCache(WeakCache&&) = delete;
    WeakCache& operator=(WeakCache&&) = delete;

    /// @brief Return the live value, or build and install a fresh one.
    /// @param factory Callable returning T; invoked only on a miss.
    /// @return Strong handle owned by the caller.
    /// @note If the factory throws, the cache is left unchanged.
    template <typename Factory>
    [[nodiscard]] Handle getOrCompute(Factory&& factory) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (Handle live = entry_.lock()) {
            return live;
        }

        auto fresh = std::make_shared<const T>(std::forward<Factory>(factory)());
        entry_ = fresh;
        ++computeCount_;
        return fresh;
    }

    /// @brief Check whether a value is currently alive.
    [[nodiscard]] bool isResident() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !entry_.expired();
    }

    /// @brief Number of times the factory has produced a value.
    [[nodiscard]] std::uint64_t computeCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return computeCount_;
    }

private:
    mutable std::mutex mutex_;
    std::weak_ptr<const T> entry_;
    std::uint64_t computeCount_ = 0;
};

}  // namespace xzb

#endif  // XZB_COMMON_WEAK_CACHE_H
