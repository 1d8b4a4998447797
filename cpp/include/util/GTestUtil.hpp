#pragma once

#include <gtest/gtest.h>

/*
 * gtest main() that also accepts the util::Logging options. Every test executable ends with:
 *
 * int main(int argc, char** argv) { return launch_gtest(argc, argv); }
 */
int launch_gtest(int argc, char** argv);
