/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------
  test_main.cpp
  ------------------------------------------------------------------
  entry point for the GoogleTest suite
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "CascadeInclude.h"

int main(int argc, char **argv)
{
  // keep Cascade_errors.txt free of expected warnings
  g_suppress_warnings=true;

  // fatal errors terminate the process; death tests re-execute the binary
  ::testing::GTEST_FLAG(death_test_style)="threadsafe";

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
