#ifndef BRANDREF_VERIFY_HPP
#define BRANDREF_VERIFY_HPP

#include <execinfo.h>

#include <cstdlib>
#include <iostream>

#define DBG_MACRO_NO_WARNING
#include <dbg.h>

// Fatal runtime checks.
//
// Misuse of brands and levels is rejected by the compiler. What remains at
// runtime is a handful of conditions the type system cannot see (heap
// exhaustion, a null location handed to an @unsafe entry point). None of them
// is recoverable: report and abort.

#define BRANDREF_PRINT_STACK_TRACE()                                   \
    do {                                                               \
        void* buffer[30];                                              \
        int size = backtrace(buffer, 30);                              \
        char** symbols = backtrace_symbols(buffer, size);              \
        if (symbols == nullptr) {                                      \
            std::cerr << "Failed to obtain stack trace." << std::endl; \
            break;                                                     \
        }                                                              \
        std::cerr << "Stack trace:" << std::endl;                      \
        for (int i = 0; i < size; ++i) {                               \
            std::cerr << symbols[i] << std::endl;                      \
        }                                                              \
        free(symbols);                                                 \
    } while (0)

#ifndef BRANDREF_VERIFY
#define BRANDREF_VERIFY(x, errmsg)       \
    do {                                 \
        if (!(x)) {                      \
            dbg(#x, errmsg);             \
            BRANDREF_PRINT_STACK_TRACE(); \
            std::abort();                \
        }                                \
    } while (0)
#endif

#endif // BRANDREF_VERIFY_HPP
