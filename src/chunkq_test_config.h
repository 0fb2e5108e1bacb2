// chunkq_test_config.h
// Overrides for the chunkq_tests target, pulled in through CHUNKQ_USER_CONFIG
// by chunkq_config.hpp, so every translation unit of the target (suites and
// bench alike) instantiates the headers with the same CHUNKQ_ASSERT.

#ifndef CHUNKQ_TEST_CONFIG_H
#define CHUNKQ_TEST_CONFIG_H

#include <cstdlib>

#if !defined(NDEBUG)
#  define CHUNKQ_ASSERT(expr) do { if(!(expr)) { std::abort(); } } while(0)
#  define CHUNKQ_TEST_ASSERTS_ON 1
#else
#  define CHUNKQ_TEST_ASSERTS_ON 0
#endif

#endif // CHUNKQ_TEST_CONFIG_H
