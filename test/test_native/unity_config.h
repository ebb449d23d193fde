/**
 * Unity Test Framework Configuration
 *
 * Shared by every test executable (built with UNITY_INCLUDE_CONFIG_H).
 */

#ifndef UNITY_CONFIG_H
#define UNITY_CONFIG_H

#include <stdint.h>

// Results go to stdout; library logging stays on stderr
#include <stdio.h>
#define UNITY_OUTPUT_CHAR(c) putchar(c)
#define UNITY_OUTPUT_FLUSH() fflush(stdout)

// Byte counts and sizes are size_t
#define UNITY_SUPPORT_64
#define UNITY_POINTER_WIDTH 64

#define UNITY_INCLUDE_DOUBLE

#endif // UNITY_CONFIG_H
