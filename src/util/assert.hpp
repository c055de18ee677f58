
#ifndef KMERGE_ASSERT_HPP
#define KMERGE_ASSERT_HPP

#if KMERGE_ASSERT
    // Use normal assertions
    #undef NDEBUG
    #include <assert.h>

    #if KMERGE_ASSERT == 2
        #define assert_heavy(expr) assert(expr)
    #else
        #define assert_heavy(expr) (void)0
    #endif
#else
    // Disable all assertions
    #define assert(expr) (void)0
    #define assert_heavy(expr) (void)0
#endif

#endif
