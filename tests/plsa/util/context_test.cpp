// Copyright (c) 2014, Sailing Lab
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice,
// this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright
// notice, this list of conditions and the following disclaimer in the
// documentation and/or other materials provided with the distribution.
//
// 3. Neither the name of the <ORGANIZATION> nor the names of its contributors
// may be used to endorse or promote products derived from this software
// without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
// LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
// CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
// SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
// CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
// ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
// POSSIBILITY OF SUCH DAMAGE.

#include <plsa/util/context.hpp>
#include <gflags/gflags.h>
#include <gtest/gtest.h>
#include <string>

DEFINE_int32(context_test_num_topics, 7, "Flag read back through Context.");
DEFINE_string(context_test_init_mode, "uniform", "Flag read back through "
    "Context.");

namespace plsa {

TEST(ContextTest, ReadsFlags) {
  Context& context = Context::get_instance();
  EXPECT_EQ(7, context.get_int32("context_test_num_topics"));
  EXPECT_EQ("uniform", context.get_string("context_test_init_mode"));
}

TEST(ContextTest, Setters) {
  Context& context = Context::get_instance();
  context.set("num_docs", 42);
  EXPECT_EQ(42, context.get_int32("num_docs"));

  context.set("epsilon", 1e-9);
  EXPECT_DOUBLE_EQ(1e-9, context.get_double("epsilon"));

  context.set("epsilon", 0.1);
  EXPECT_EQ(0.1, context.get_double("epsilon"));

  context.set("init_mode", "random");
  EXPECT_EQ("random", context.get_string("init_mode"));
}

TEST(ContextTest, Singleton) {
  Context::get_instance().set("shared", 3);
  EXPECT_EQ(3, Context::get_instance().get_int32("shared"));
}

TEST(ContextDeathTest, MissingKey) {
  EXPECT_DEATH(Context::get_instance().get_string("no_such_key"),
      "Failed to lookup no_such_key");
}

}  // namespace plsa
