/*
 * ikecodec_driver.cc
 *
 * main() file for the IKE codec unit tests
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
