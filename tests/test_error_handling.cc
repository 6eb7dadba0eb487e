/*
 * Copyright (C) 2026 Swift Navigation Inc.
 * Contact: Swift Navigation <dev@swiftnav.com>
 *
 * This source is subject to the license found in the file 'LICENSE' which must
 * be distributed together with this source. All other rights reserved.
 *
 * THIS CODE AND INFORMATION IS PROVIDED "AS IS" WITHOUT WARRANTY OF ANY KIND,
 * EITHER EXPRESSED OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND/OR FITNESS FOR A PARTICULAR PURPOSE.
 */

#include <tandem/Common>

#include <gtest/gtest.h>

namespace tandem {

bool add_one(int *x) {
  (*x) += 1;
  return true;
}

TEST(test_error_handling, test_assert_evaluates) {
  int x = 0;
  TANDEM_ASSERT(add_one(&x));
  EXPECT_EQ(x, 1);
}

TEST(test_error_handling, test_casts) {
  EXPECT_EQ(cast::to_size(Eigen::Index(7)), 7u);
  EXPECT_EQ(cast::to_index(std::size_t(7)), Eigen::Index(7));
  EXPECT_EQ(cast::to_double(std::size_t(3)), 3.);
  EXPECT_EQ(cast::to_double(Eigen::Index(5)), 5.);
}

} // namespace tandem
