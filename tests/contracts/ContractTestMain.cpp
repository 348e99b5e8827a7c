// Repository: MetaSEI
// Component: Contract Test Main
// Purpose: gtest entry point that installs the contract coverage check.
// Copyright (c) 2025 MetaSEI

#include "ContractRegistryEnvironment.h"

#include <gtest/gtest.h>

int main(int argc, char **argv)
{
  ::testing::InitGoogleTest(&argc, argv);
  ::testing::AddGlobalTestEnvironment(new metasei::tests::ContractRegistryEnvironment());
  return RUN_ALL_TESTS();
}
