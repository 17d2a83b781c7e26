#pragma once
#include <cmath>
#include <cstdio>

// Shared by the standalone test programs; each one is a single translation unit.
static int tests_passed = 0;
static int tests_failed = 0;

static void printTestHeader(const char* testName) {
    printf("\n========================================\n");
    printf("%s\n", testName);
    printf("========================================\n");
}

static void printTestResult(const char* testName, bool passed) {
    if (passed) {
        printf("PASS: ");
        tests_passed++;
    } else {
        printf("FAIL: ");
        tests_failed++;
    }
    printf("%s\n", testName);
}

// Prints the check and returns its outcome so a test can && them together
static bool check(bool condition, const char* what) {
    if (!condition) printf("  check failed: %s\n", what);
    return condition;
}

static bool nearlyEqual(float a, float b, float tolerance = 1e-5f) {
    return std::fabs(a - b) <= tolerance;
}

static int printSummary(const char* suite) {
    printf("\n========================================\n");
    printf("TEST SUMMARY: %s\n", suite);
    printf("========================================\n");
    printf("Total Tests: %d\n", tests_passed + tests_failed);
    printf("Passed: %d\n", tests_passed);
    printf("Failed: %d\n", tests_failed);
    if (tests_failed == 0) {
        printf("\nALL TESTS PASSED\n");
    } else {
        printf("\nSOME TESTS FAILED\n");
    }
    return tests_failed == 0 ? 0 : 1;
}
