#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <memory>
#include <new>
#include <print>
#include <type_traits>
#include <utility>

// #define ARC_DEBUG 1

#ifdef ARC_DEBUG
#define ARC_LOG(...) std::println(__VA_ARGS__)
#else
#define ARC_LOG(...) (void) 0
#endif

namespace arc::detail {
    /**
     * @brief Layout of the strong counter word
     * @details The low two bits are flags, the remaining bits count live strong
     * handles in units of kSingleStrong. The weak counter counts plain units.
     */
    inline constexpr size_t kWeakExist = 1;  ///< Group weak unit is held by the strong side
    inline constexpr size_t kClosed = 2;  ///< Payload destroyed, never revived
    inline constexpr size_t kSingleStrong = 4;
    inline constexpr size_t kSingleWeak = 1;
    inline constexpr size_t kMaxRefcount = static_cast<size_t>(PTRDIFF_MAX);

    template<typename T>
    concept Payload = std::is_object_v<T> && !std::is_array_v<T> &&
                      std::is_nothrow_destructible_v<T>;

    /**
     * @brief Report an unrecoverable invariant violation and abort the process
     * @param fmt Diagnostic printed to stderr after an "arc: " prefix
     */
    template<typename... Args>
    [[noreturn]] void fatal(std::format_string<Args...> fmt, Args&&... args) noexcept {
        std::print(stderr, "arc: ");
        std::println(stderr, fmt, std::forward<Args>(args)...);
        std::abort();
    }

    inline void check_refcount(size_t old) noexcept {
        if (old > kMaxRefcount) [[unlikely]] {
            fatal("reference count overflow");
        }
    }

    /**
     * @brief Heap block shared by every Arc and Weak bound to one value
     * @details Holds both counters and in-place storage for the payload. The
     * block is never moved; its address is the identity of the value.
     * @tparam T Payload type
     */
    template<Payload T>
    class ArcInner {
    public:
        std::atomic_size_t strong{kSingleStrong};  ///< Strong units plus flag bits
        std::atomic_size_t weak{0};  ///< Weak units, including the group unit

        ArcInner(const ArcInner&) = delete;
        ArcInner& operator=(const ArcInner&) = delete;

        /**
         * @brief Allocate a block and construct the payload in place
         * @details Allocation failure aborts. If the payload constructor throws,
         * the raw memory is returned before the exception propagates.
         * @param args Arguments forwarded to T's constructor
         * @return Block owned by exactly one strong unit
         */
        template<typename... Args>
        [[nodiscard]] static ArcInner* allocate(Args&&... args) {
            void* raw = ::operator new(sizeof(ArcInner), alignment(), std::nothrow);
            if (!raw) [[unlikely]] {
                fatal("memory allocation of {} bytes failed", sizeof(ArcInner));
            }

            try {
                auto* inner = std::construct_at(static_cast<ArcInner*>(raw),
                                                std::in_place,
                                                std::forward<Args>(args)...);
                ARC_LOG("arc: allocated block {}", raw);
                return inner;
            } catch (...) {
                ::operator delete(raw, sizeof(ArcInner), alignment());
                throw;
            }
        }

        /**
         * @brief Release the block memory
         * @details The payload must already be destroyed.
         */
        static void deallocate(ArcInner* inner) noexcept {
            ARC_LOG("arc: freeing block {}", static_cast<const void*>(inner));
            std::destroy_at(inner);
            ::operator delete(static_cast<void*>(inner), sizeof(ArcInner), alignment());
        }

        [[nodiscard]] constexpr T* ptr() noexcept {
            return std::assume_aligned<alignof(T)>(
                std::launder(reinterpret_cast<T*>(m_storage.data())));
        }

        [[nodiscard]] constexpr const T* ptr() const noexcept {
            return std::assume_aligned<alignof(T)>(
                std::launder(reinterpret_cast<const T*>(m_storage.data())));
        }

        void destroy_value() noexcept {
            ARC_LOG("arc: destroying payload of block {}", static_cast<const void*>(this));
            std::destroy_at(ptr());
        }

        template<typename... Args>
        explicit ArcInner(std::in_place_t, Args&&... args) {
            ::new (static_cast<void*>(m_storage.data())) T(std::forward<Args>(args)...);
        }

        ~ArcInner() = default;

    private:
        static constexpr std::align_val_t alignment() noexcept {
            return std::align_val_t{alignof(ArcInner)};
        }

        // clang-format off
        alignas(T) std::array<std::byte, sizeof(T)> m_storage;  ///< Storage for the payload
        // clang-format on
    };

    template<typename T>
    void release_weak(ArcInner<T>* inner) noexcept;

    /**
     * @brief Add a strong unit on behalf of a caller already holding one
     */
    template<typename T>
    void acquire_strong_from_strong(ArcInner<T>* inner) noexcept {
        check_refcount(inner->strong.fetch_add(kSingleStrong, std::memory_order_relaxed));
    }

    /**
     * @brief Try to add a strong unit on behalf of a Weak handle
     * @details The increment is speculative. If the block is already closed the
     * unit is left behind: nothing reads the strong magnitude once kClosed is
     * set. Reviving a block whose strong count fell to zero also takes a weak
     * unit, since the strong side that is about to close will release one.
     * @return true if the caller now owns a strong unit on a live payload
     */
    template<typename T>
    [[nodiscard]] bool acquire_strong_from_weak(ArcInner<T>* inner) noexcept {
        auto old = inner->strong.fetch_add(kSingleStrong, std::memory_order_acquire);
        check_refcount(old);
        if (old & kClosed) {
            ARC_LOG("arc: upgrade failed on closed block {}", static_cast<const void*>(inner));
            return false;
        }

        if (old < kSingleStrong) {
            ARC_LOG("arc: reviving block {}", static_cast<const void*>(inner));
            check_refcount(inner->weak.fetch_add(kSingleWeak, std::memory_order_relaxed));
        }
        return true;
    }

    /**
     * @brief Drop one strong unit, destroying the payload and freeing the block
     * when this was the last reference of its kind
     */
    template<typename T>
    void release_strong(ArcInner<T>* inner) noexcept {
        auto old = inner->strong.fetch_sub(kSingleStrong, std::memory_order_release);
        if (old > kSingleStrong + kWeakExist) {
            return;
        }

        if ((old & kWeakExist) == 0) {
            std::atomic_thread_fence(std::memory_order_acquire);
            inner->destroy_value();
            ArcInner<T>::deallocate(inner);
            return;
        }

        // A concurrent upgrade may revive the block between the decrement and
        // this exchange; the loser leaves the payload alone.
        size_t expected = kWeakExist;
        if (inner->strong.compare_exchange_strong(expected,
                                                  kClosed,
                                                  std::memory_order_acq_rel,
                                                  std::memory_order_relaxed)) {
            inner->destroy_value();
        }
        release_weak(inner);
    }

    template<typename T>
    void acquire_weak_from_weak(ArcInner<T>* inner) noexcept {
        check_refcount(inner->weak.fetch_add(kSingleWeak, std::memory_order_relaxed));
    }

    /**
     * @brief Add a weak unit on behalf of a strong handle
     * @details The first downgrade of a block takes two units at once: the
     * caller's and the group unit held by all strong handles together.
     */
    template<typename T>
    void acquire_weak_from_strong(ArcInner<T>* inner) noexcept {
        size_t expected = 0;
        if (inner->weak.load(std::memory_order_relaxed) == 0 &&
            inner->weak.compare_exchange_strong(expected,
                                                kSingleWeak * 2,
                                                std::memory_order_relaxed,
                                                std::memory_order_relaxed)) {
            inner->strong.fetch_add(kWeakExist, std::memory_order_relaxed);
            return;
        }
        acquire_weak_from_weak(inner);
    }

    template<typename T>
    void release_weak(ArcInner<T>* inner) noexcept {
        if (inner->weak.fetch_sub(kSingleWeak, std::memory_order_release) == kSingleWeak) {
            std::atomic_thread_fence(std::memory_order_acquire);
            ArcInner<T>::deallocate(inner);
        }
    }
}  // namespace arc::detail
