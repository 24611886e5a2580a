#pragma once

#include "assert/assert.hpp"

// Verification checks stay enabled in release builds. A failed check throws
// sentinel::check_failure carrying the message and the values passed after it.
#define SENTINEL_CHECK(expr, ...) \
    ASSERT_INVOKE(expr, false, true, "SENTINEL_CHECK", verification, , __VA_ARGS__)

namespace sentinel {
using check_failure = libassert::verification_failure;
}
