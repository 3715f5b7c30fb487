#pragma once

// Helper macros to declare/delete copy-moves inside class definition.
// Static checks like MINIHTTP_TEST_MOVE_NOEX must be used OUTSIDE class definition:
/*
    class A{};
    MINIHTTP_TEST_MOVE_NOEX(A);
*/

// NOLINTNEXTLINE
#define MINIHTTP_TEST_MOVE_NOEX(TYPE)                                                              \
    static_assert(std::is_nothrow_move_constructible_v<TYPE>                                       \
                    && std::is_nothrow_move_assignable_v<TYPE>,                                    \
                  " Should be noexcept Moves.")

// NOLINTNEXTLINE
#define NO_COPYMOVE(TYPE)                                                                          \
    TYPE(const TYPE &) = delete;                                                                   \
    TYPE(TYPE &&) = delete;                                                                        \
    TYPE &operator=(const TYPE &) = delete;                                                        \
    TYPE &operator=(TYPE &&) = delete

// NOLINTNEXTLINE
#define DEFAULT_COPYMOVE(TYPE)                                                                     \
    TYPE(const TYPE &) = default;                                                                  \
    TYPE(TYPE &&) = default;                                                                       \
    TYPE &operator=(const TYPE &) = default;                                                       \
    TYPE &operator=(TYPE &&) = default // NOLINT

// NOLINTNEXTLINE
#define MOVEONLY_ALLOWED(TYPE)                                                                     \
    TYPE(const TYPE &) = delete;                                                                   \
    TYPE(TYPE &&) = default;                                                                       \
    TYPE &operator=(const TYPE &) = delete;                                                        \
    TYPE &operator=(TYPE &&) = default // NOLINT
