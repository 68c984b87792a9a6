/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include "common/outcome.hpp"

#define DATEX_CONCAT_(a, b) a##b
#define DATEX_CONCAT(a, b) DATEX_CONCAT_(a, b)
#define DATEX_UNIQUE_NAME(base) DATEX_CONCAT(base, __LINE__)

#define EXPECT_OUTCOME_TRUE_void(var, expr) \
  auto &&var = expr;                        \
  EXPECT_TRUE(var) << "Line " << __LINE__ << ": " << var.error().message();

#define EXPECT_OUTCOME_TRUE_name(var, val, expr)                            \
  auto &&var = expr;                                                        \
  EXPECT_TRUE(var) << "Line " << __LINE__ << ": " << var.error().message(); \
  auto &&val = var.value();

#define EXPECT_OUTCOME_FALSE_void(var, expr) \
  auto &&var = expr;                         \
  EXPECT_FALSE(var) << "Line " << __LINE__;

#define EXPECT_OUTCOME_FALSE_name(var, val, expr) \
  auto &&var = expr;                              \
  EXPECT_FALSE(var) << "Line " << __LINE__;       \
  auto &&val = var.error();

/// Expects result to be success, ignores its value
#define EXPECT_OUTCOME_TRUE_1(expr) \
  EXPECT_OUTCOME_TRUE_void(DATEX_UNIQUE_NAME(_r), expr)

/// Expects result to be success, binds its value to val
#define EXPECT_OUTCOME_TRUE(val, expr) \
  EXPECT_OUTCOME_TRUE_name(DATEX_UNIQUE_NAME(_r), val, expr)

/// Expects result to be failure, binds its error to val
#define EXPECT_OUTCOME_FALSE(val, expr) \
  EXPECT_OUTCOME_FALSE_name(DATEX_UNIQUE_NAME(_f), val, expr)

#define EXPECT_OUTCOME_FALSE_1(expr) \
  EXPECT_OUTCOME_FALSE_void(DATEX_UNIQUE_NAME(_v), expr)

/// Expects result to be success with value equal to expected
#define EXPECT_OUTCOME_EQ(expr, expected)                               \
  {                                                                     \
    auto &&_result = expr;                                              \
    EXPECT_TRUE(_result) << "Line " << __LINE__ << ": "                 \
                         << _result.error().message();                  \
    if (_result) {                                                      \
      EXPECT_EQ(_result.value(), expected);                             \
    }                                                                   \
  }

/// Expects result to be failure with the error
#define EXPECT_OUTCOME_ERROR(expected, expr)                           \
  {                                                                    \
    auto &&_result = expr;                                             \
    EXPECT_TRUE(_result.has_error()) << "Line " << __LINE__;           \
    if (_result.has_error()) {                                         \
      EXPECT_EQ(_result.error(), make_error_code(expected));           \
    }                                                                  \
  }
