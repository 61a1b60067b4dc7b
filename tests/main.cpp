/**
 * @file main.cpp
 * @brief Catch2 entry point for the shopcheck test suite
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
