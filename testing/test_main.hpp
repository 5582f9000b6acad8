#pragma once

// Include this header in exactly ONE .cpp file (your test runner entry point).
// It defines main() and hands control to the test registry.
//
// An optional first argument restricts the run to suites whose name contains it:
//   ./profiler_test ScopedAction
//
// Example:
//   // test.cpp
//   #include "../testing/test_main.hpp"
//   #include "profiler.hxx"

#include "test_framework.hpp"

auto main(int argc, char** argv) -> int { return ::testing::test_registry::instance().run_all(argc > 1 ? argv[1] : ""); }
