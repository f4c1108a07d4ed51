#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <format>
#include <functional>
#include <print>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#ifndef ARC_MODEL_ROUNDS
#define ARC_MODEL_ROUNDS 1000
#endif

namespace testing {
    namespace detail {
        template<typename T>
        concept Formattable = requires(const T& value) {
            { std::format("{}", value) } -> std::convertible_to<std::string>;
        };

        template<typename T>
        concept Streamable = requires(const T& value, std::ostream& os) {
            { os << value } -> std::same_as<std::ostream&>;
        };

        template<typename T>
        [[nodiscard]] auto format_value(const T& value) -> std::string {
            if constexpr (std::is_pointer_v<std::remove_cvref_t<T>>) {
                if (value == nullptr) {
                    return "nullptr";
                }
                return std::format("0x{:016x}", reinterpret_cast<uintptr_t>(value));
            } else if constexpr (Formattable<T>) {
                return std::format("{}", value);
            } else {
                std::ostringstream oss;
                if constexpr (Streamable<T>) {
                    oss << value;
                    return oss.str();
                }
                return "[unformattable]";
            }
        }

        template<size_t N>
        struct FixedString {
            std::array<char, N> chars{};
            consteval FixedString(const char (&str)[N]) { std::copy_n(str, N, chars.data()); }
            constexpr operator std::string_view() const { return {chars.data(), N - 1}; }
            [[nodiscard]] constexpr std::string_view view() const { return {chars.data(), N - 1}; }
        };
    }  // namespace detail

    [[noreturn]] inline void fail(std::string_view message, const std::source_location& loc =
                                                                std::source_location::current()) {
        std::println(
            "\n\033[31mAssertion failed!\033[0m\n  Location: {}:{}\n  Function: {}\n  Message : {}",
            loc.file_name(),
            loc.line(),
            loc.function_name(),
            message);

        std::terminate();
    }

    template<detail::FixedString Expr>
    void assert_that(bool condition,
                     const std::source_location& loc = std::source_location::current()) {
        if (!condition) {
            fail(std::format("Assertion failed: {}", Expr.view()), loc);
        }
    }

    template<detail::FixedString Expr>
    void assert_that(bool condition, const std::string& info,
                     const std::source_location& loc = std::source_location::current()) {
        if (!condition) {
            fail(std::format("Assertion failed: {}\n  Info: {}", Expr.view(), info), loc);
        }
    }

    template<detail::FixedString Message, typename Lhs, typename Rhs>
    void assert_eq(Lhs&& lhs, Rhs&& rhs,
                   const std::source_location& loc = std::source_location::current()) {
        if (!(lhs == rhs)) {
            // clang-format off
            fail(std::format("Assertion failed: {}\n  Values: {} != {}",
                             Message.view(),
                             detail::format_value(std::forward<Lhs>(lhs)),
                             detail::format_value(std::forward<Rhs>(rhs))),
                             loc);
            // clang-format on
        }
    }

    template<detail::FixedString LhsExpr, detail::FixedString RhsExpr, typename Lhs, typename Rhs>
    void assert_eq(Lhs&& lhs, Rhs&& rhs,
                   const std::source_location& loc = std::source_location::current()) {
        if (!(lhs == rhs)) {
            // clang-format off
            fail(std::format("Assertion failed: {} == {}\n  Values: {} != {}",
                            LhsExpr.view(),
                            RhsExpr.view(),
                            detail::format_value(std::forward<Lhs>(lhs)),
                            detail::format_value(std::forward<Rhs>(rhs))),
                            loc);
            // clang-format on
        }
    }

    template<detail::FixedString LhsExpr, detail::FixedString RhsExpr, typename Lhs, typename Rhs>
    void assert_ne(Lhs&& lhs, Rhs&& rhs,
                   const std::source_location& loc = std::source_location::current()) {
        if (!(lhs != rhs)) {
            // clang-format off
            fail(std::format("Assertion failed: {} != {}\n  Both values: {}",
                            LhsExpr.view(),
                            RhsExpr.view(),
                            detail::format_value(std::forward<Lhs>(lhs))),
                            loc);
            // clang-format on
        }
    }

    struct TestCase {
        std::string_view name;
        std::function<void()> func;
        std::source_location location;
    };

    inline auto& test_registry() {
        static std::vector<TestCase> registry;
        return registry;
    }

    template<detail::FixedString Name, auto Func>
    struct TestRegistrar {
        TestRegistrar(const std::source_location& loc = std::source_location::current()) {
            test_registry().emplace_back(
                Name.view(),
                [] {
                    if constexpr (std::is_invocable_v<decltype(Func)>) {
                        try {
                            Func();
                        } catch (const std::exception& e) {
                            fail(std::format("Test threw exception: {}", e.what()));
                        } catch (...) {
                            fail("Test threw unknown exception");
                        }
                    }
                },
                loc);
        }
    };

    /**
     * @brief Counts block allocations made through the aligned allocation functions
     * @details The counters are bumped by the replacement operator new/delete
     * defined in the test executable.
     */
    struct BlockTracker {
        static inline std::atomic_int allocations{0};
        static inline std::atomic_int deallocations{0};
        static inline std::atomic_bool fail_allocations{false};  ///< Make allocation report exhaustion

        static void reset() {
            allocations = 0;
            deallocations = 0;
        }

        [[nodiscard]] static int live() { return allocations.load() - deallocations.load(); }

        static void check_balanced(const std::source_location& loc =
                                       std::source_location::current()) {
            if (allocations != deallocations) {
                fail(std::format("Memory leak detected!\n  Allocations  : {}\n  Deallocations: {}",
                                 allocations.load(),
                                 deallocations.load()),
                     loc);
            }
        }
    };

    struct ChildResult {
        bool aborted{false};  ///< Terminated by SIGABRT
        std::string error_output;  ///< Everything the child wrote to stderr
    };

    /**
     * @brief Run a body in a forked child, capturing its stderr
     * @details Used for paths that end the process. The child exits normally
     * if the body returns.
     */
    template<typename F>
    [[nodiscard]] ChildResult run_in_child(F&& body) {
        int fds[2];
        if (::pipe(fds) != 0) {
            fail("pipe() failed");
        }

        std::fflush(nullptr);
        pid_t pid = ::fork();
        if (pid < 0) {
            fail("fork() failed");
        }

        if (pid == 0) {
            ::close(fds[0]);
            ::dup2(fds[1], STDERR_FILENO);
            ::close(fds[1]);
            body();
            std::fflush(nullptr);
            ::_exit(0);
        }

        ::close(fds[1]);
        ChildResult result;
        std::array<char, 256> buffer{};
        ssize_t n = 0;
        while ((n = ::read(fds[0], buffer.data(), buffer.size())) > 0) {
            result.error_output.append(buffer.data(), static_cast<size_t>(n));
        }
        ::close(fds[0]);

        int status = 0;
        if (::waitpid(pid, &status, 0) != pid) {
            fail("waitpid() failed");
        }
        result.aborted = WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
        return result;
    }

    /**
     * @brief Run a concurrent scenario many times to cover more interleavings
     * @param scenario Self-contained test body; must spawn and join its own threads
     */
    template<typename F>
    void model(F&& scenario) {
        for (size_t round = 0; round < ARC_MODEL_ROUNDS; ++round) {
            BlockTracker::reset();
            scenario();
            BlockTracker::check_balanced();
        }
    }
}  // namespace testing

#define TEST_CASE(name)                                                          \
    void name();                                                                 \
    [[maybe_unused]]                                                             \
    inline const auto _register_##name = testing::TestRegistrar<#name, &name>{}; \
    void name()
