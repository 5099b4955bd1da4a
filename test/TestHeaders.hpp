#ifndef __EB_TEST_HEADERS__
#define __EB_TEST_HEADERS__

#include "Headers.hpp"

#include <catch2/catch_all.hpp>

using Catch::Matchers::ContainsSubstring;

#endif  // __EB_TEST_HEADERS__
