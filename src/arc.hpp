#pragma once

#include <atomic>
#include <cstddef>
#include <format>
#include <optional>
#include <utility>

#include "arc_inner.hpp"

namespace arc {
    /// @brief Forward declaration of Weak
    template<detail::Payload T>
    class Weak;

    /**
     * @brief Atomically reference counted owning handle
     * @details Every Arc bound to a block owns one strong unit. The payload is
     * only reachable through const access; wrap it in a synchronized type if it
     * has to change. A moved-from or reset Arc is empty and owns nothing.
     * @tparam T Type of the managed value
     */
    template<detail::Payload T>
    class Arc {
    public:
        using element_type = T;

        /**
         * @brief Allocate a new block holding a value built from args
         * @param args Arguments forwarded to T's constructor
         * @return Arc owning the only strong unit of the new block
         */
        template<typename... Args>
        [[nodiscard]] static Arc make(Args&&... args) {
            return Arc(detail::ArcInner<T>::allocate(std::forward<Args>(args)...));
        }

        ~Arc() {
            if (m_inner) {
                detail::release_strong(m_inner);
            }
        }

        Arc(const Arc& other) noexcept : m_inner(other.m_inner) {
            if (m_inner) {
                detail::acquire_strong_from_strong(m_inner);
            }
        }

        constexpr Arc(Arc&& other) noexcept : m_inner(std::exchange(other.m_inner, nullptr)) {}

        Arc& operator=(const Arc& other) noexcept {
            Arc(other).swap(*this);
            return *this;
        }

        Arc& operator=(Arc&& other) noexcept {
            Arc(std::move(other)).swap(*this);
            return *this;
        }

        /// @brief Take another strong unit on the same block
        [[nodiscard]] Arc clone() const noexcept { return Arc(*this); }

        /**
         * @brief Create a Weak handle observing the same block
         * @return Bound Weak, or a dangling one if this Arc is empty
         */
        [[nodiscard]] Weak<T> downgrade() const noexcept {
            if (!m_inner) {
                return Weak<T>();
            }
            detail::acquire_weak_from_strong(m_inner);
            return Weak<T>(m_inner);
        }

        [[nodiscard]] const T& operator*() const noexcept { return *m_inner->ptr(); }
        [[nodiscard]] const T* operator->() const noexcept { return m_inner->ptr(); }
        [[nodiscard]] const T* get() const noexcept { return m_inner ? m_inner->ptr() : nullptr; }

        [[nodiscard]] constexpr explicit operator bool() const noexcept {
            return m_inner != nullptr;
        }

        /// @brief Number of live strong handles, for diagnostics only
        [[nodiscard]] size_t strong_count() const noexcept {
            return m_inner ? m_inner->strong.load(std::memory_order_relaxed) / detail::kSingleStrong
                           : 0;
        }

        /// @brief Weak units including the group unit, for diagnostics only
        [[nodiscard]] size_t weak_count() const noexcept {
            return m_inner ? m_inner->weak.load(std::memory_order_relaxed) : 0;
        }

        void reset() noexcept {
            if (auto* inner = std::exchange(m_inner, nullptr)) {
                detail::release_strong(inner);
            }
        }

        constexpr void swap(Arc& other) noexcept { std::swap(m_inner, other.m_inner); }

        /// @brief True when both handles are bound to the same block
        [[nodiscard]] friend constexpr bool ptr_eq(const Arc& lhs, const Arc& rhs) noexcept {
            return lhs.m_inner == rhs.m_inner;
        }

    private:
        friend class Weak<T>;

        constexpr explicit Arc(detail::ArcInner<T>* inner) noexcept : m_inner(inner) {}

        detail::ArcInner<T>* m_inner{nullptr};
    };

    /**
     * @brief Non-owning observer of an Arc's block
     * @details A default constructed Weak is dangling: it is bound to no block,
     * never allocates and always fails to upgrade.
     * @tparam T Type of the managed value
     */
    template<detail::Payload T>
    class Weak {
    public:
        using element_type = T;

        constexpr Weak() noexcept = default;

        ~Weak() {
            if (m_inner) {
                detail::release_weak(m_inner);
            }
        }

        Weak(const Weak& other) noexcept : m_inner(other.m_inner) {
            if (m_inner) {
                detail::acquire_weak_from_weak(m_inner);
            }
        }

        constexpr Weak(Weak&& other) noexcept : m_inner(std::exchange(other.m_inner, nullptr)) {}

        Weak& operator=(const Weak& other) noexcept {
            Weak(other).swap(*this);
            return *this;
        }

        Weak& operator=(Weak&& other) noexcept {
            Weak(std::move(other)).swap(*this);
            return *this;
        }

        [[nodiscard]] Weak clone() const noexcept { return Weak(*this); }

        /**
         * @brief Try to obtain an owning handle
         * @return Arc sharing the block, or std::nullopt once the value is gone
         */
        [[nodiscard]] std::optional<Arc<T>> upgrade() const noexcept {
            if (!m_inner || !detail::acquire_strong_from_weak(m_inner)) {
                return std::nullopt;
            }
            return Arc<T>(m_inner);
        }

        [[nodiscard]] constexpr bool is_dangling() const noexcept { return m_inner == nullptr; }

        [[nodiscard]] size_t strong_count() const noexcept {
            if (!m_inner) {
                return 0;
            }
            auto strong = m_inner->strong.load(std::memory_order_relaxed);
            return (strong & detail::kClosed) ? 0 : strong / detail::kSingleStrong;
        }

        [[nodiscard]] size_t weak_count() const noexcept {
            return m_inner ? m_inner->weak.load(std::memory_order_relaxed) : 0;
        }

        void reset() noexcept {
            if (auto* inner = std::exchange(m_inner, nullptr)) {
                detail::release_weak(inner);
            }
        }

        constexpr void swap(Weak& other) noexcept { std::swap(m_inner, other.m_inner); }

    private:
        friend class Arc<T>;

        // Adopts a weak unit the caller has already taken.
        constexpr explicit Weak(detail::ArcInner<T>* inner) noexcept : m_inner(inner) {}

        detail::ArcInner<T>* m_inner{nullptr};
    };

    /**
     * @brief Create an Arc holding a value built in place
     * @tparam T Type of object to create
     * @param args Arguments for constructor
     * @return Arc<T> owning the new value
     */
    template<detail::Payload T, typename... Args>
    [[nodiscard]] Arc<T> make_arc(Args&&... args) {
        return Arc<T>::make(std::forward<Args>(args)...);
    }
}  // namespace arc

template<arc::detail::Payload T>
    requires std::formattable<T, char>
struct std::formatter<arc::Arc<T>> {
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    auto format(const arc::Arc<T>& value, std::format_context& ctx) const {
        if (!value) {
            return std::format_to(ctx.out(), "Arc {{ <empty> }}");
        }
        // clang-format off
        return std::format_to(ctx.out(), "Arc {{ strong: {}, weak: {}, inner: {} }}",
                              value.strong_count(),
                              value.weak_count(),
                              *value);
        // clang-format on
    }
};

template<arc::detail::Payload T>
struct std::formatter<arc::Weak<T>> {
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    auto format(const arc::Weak<T>&, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "Weak");
    }
};
