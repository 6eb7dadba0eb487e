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

#ifndef INCLUDE_TANDEM_SRC_DETAILS_ERROR_HANDLING_HPP_
#define INCLUDE_TANDEM_SRC_DETAILS_ERROR_HANDLING_HPP_

/*
 * Configuration errors (mismatched dimensions, a non positive definite
 * mass matrix, a non-positive step size ...) are caught with TANDEM_ASSERT.
 *
 * The fact that assert() behaves differently in debug and release mode can
 * cause a number of headaches.  For example, if you do something like:
 *
 *   assert(function_with_side_effects());
 *
 * that function call will have side effects during debug, but not release.
 * Here we define a separate macro which always evaluates its argument (even
 * in release mode) and avoids the unused variable problem.
 *
 * https://web.archive.org/web/20201129200055/http://cnicholson.net/2009/02/stupid-c-tricks-adventures-in-assert/
 *
 * Numerical problems encountered while sampling (divergent trajectories,
 * non-finite energies) are NOT errors, they are reported through the
 * diagnostic records returned by the kernels.
 */
#ifdef NDEBUG
#define TANDEM_ASSERT(x)                                                       \
  do {                                                                         \
    (void)(x);                                                                 \
  } while (0)
#else
#include <assert.h>
#define TANDEM_ASSERT(x) assert((x))
#endif

#endif /* INCLUDE_TANDEM_SRC_DETAILS_ERROR_HANDLING_HPP_ */
