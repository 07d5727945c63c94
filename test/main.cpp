#include <iostream>
#include <string>

/* Registro de suites */
bool testAddressDecoder();
bool testCacheSet();
bool testCacheLevel();
bool testHierarchy();
bool testHierarchyConfig();
bool testTrace();
bool testStats();

int main() {
  bool allPassed = true;

  std::cout << "\n=== Running all tests ===\n";
  allPassed &= testAddressDecoder();
  allPassed &= testCacheSet();
  allPassed &= testCacheLevel();
  allPassed &= testHierarchy();
  allPassed &= testHierarchyConfig();
  allPassed &= testTrace();
  allPassed &= testStats();

  return allPassed ? 0 : 1; /* exit != 0 hace fallar ctest */
}
