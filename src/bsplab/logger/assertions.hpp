/**  
 * Copyright (c) 2009 Carnegie Mellon University. 
 *     All rights reserved.
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing,
 *  software distributed under the License is distributed on an "AS
 *  IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either
 *  express or implied.  See the License for the specific language
 *  governing permissions and limitations under the License.
 *
 * For more about this software visit:
 *
 *      http://www.graphlab.ml.cmu.edu
 *
 */


/**
 * @file assertions.hpp
 *
 * Runtime checks built on the logger. A failed check writes the failing
 * condition, the source location and a backtrace through
 * logstream(LOG_FATAL), which throws. Unlike assert() these checks are
 * compiled in every build.
 *
 * \code
 *   ASSERT_LT(node_id, node_count);
 *   ASSERT_MSG(schema.has_element(key), "missing key %s", key.c_str());
 * \endcode
 */

#ifndef BSPLAB_LOGGER_ASSERTIONS_HPP
#define BSPLAB_LOGGER_ASSERTIONS_HPP

#include <bsplab/logger/logger.hpp>

#define BSPLAB_CHECK_OP(op, val1, val2)                                  \
  do {                                                                  \
    if (__builtin_expect(!((val1) op (val2)), 0)) {                     \
      logstream(LOG_FATAL) << "Check failed: " << #val1 << " "          \
                           << #op << " " << #val2                       \
                           << " [" << (val1) << " " << #op << " "       \
                           << (val2) << "]" << std::endl;               \
    }                                                                   \
  } while(0)

#define ASSERT_TRUE(cond)                                               \
  do {                                                                  \
    if (__builtin_expect(!(cond), 0)) {                                 \
      logstream(LOG_FATAL) << "Check failed: " << #cond << std::endl;   \
    }                                                                   \
  } while(0)

#define ASSERT_FALSE(cond) ASSERT_TRUE(!(cond))

#define ASSERT_EQ(val1, val2) BSPLAB_CHECK_OP(==, val1, val2)
#define ASSERT_NE(val1, val2) BSPLAB_CHECK_OP(!=, val1, val2)
#define ASSERT_LE(val1, val2) BSPLAB_CHECK_OP(<=, val1, val2)
#define ASSERT_LT(val1, val2) BSPLAB_CHECK_OP(<, val1, val2)
#define ASSERT_GE(val1, val2) BSPLAB_CHECK_OP(>=, val1, val2)
#define ASSERT_GT(val1, val2) BSPLAB_CHECK_OP(>, val1, val2)

#define ASSERT_MSG(cond, fmt, ...)                                      \
  do {                                                                  \
    if (__builtin_expect(!(cond), 0)) {                                 \
      logger(LOG_ERROR, "Check failed: %s", #cond);                     \
      logger(LOG_FATAL, fmt, ##__VA_ARGS__);                            \
    }                                                                   \
  } while(0)

#endif
