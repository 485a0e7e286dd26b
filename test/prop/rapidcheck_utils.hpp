#pragma once

#include <catch2/catch.hpp>
#include <rapidcheck.h>

//! Checks a rapidcheck property inside a Catch2 test case.
//! Sometimes double parenthesis are needed around testable.
#define PROPERTY(testable)                                                                         \
    {                                                                                              \
        bool property_ok = rc::check(testable);                                                    \
        REQUIRE(property_ok);                                                                      \
    }
