#define LAZYCOLL_TYPES_ENABLE_RUN_TESTS 1
#define LAZYCOLL_LAZY_ENABLE_RUN_TESTS 1
#define LAZYCOLL_INDEXED_ENABLE_RUN_TESTS 1

#include <types.hpp>
#include <lazy.hpp>
#include <indexed.hpp>

int main()
{
#if LAZYCOLL_TYPES_ENABLE_RUN_TESTS
    lazycoll::types::impl::run_tests();
#endif

#if LAZYCOLL_LAZY_ENABLE_RUN_TESTS
    lazycoll::lazy::impl::run_tests();
#endif

#if LAZYCOLL_INDEXED_ENABLE_RUN_TESTS
    lazycoll::indexed::impl::run_tests();
#endif

    return 0;
}
