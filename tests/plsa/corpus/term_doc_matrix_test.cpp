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

#include <plsa/corpus/term_doc_matrix.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace plsa {

TEST(TermDocMatrixTest, ExampleCorpus) {
  std::vector<Document> docs = {
    {"the", "cat", "sat"},
    {"the", "dog", "sat"}
  };
  Vocabulary vocab = {"the", "cat", "sat", "dog"};
  TermDocMatrix counts(docs, vocab);

  ASSERT_EQ(2, counts.num_docs());
  ASSERT_EQ(4, counts.vocab_size());
  std::vector<int32_t> expected0 = {1, 1, 1, 0};
  std::vector<int32_t> expected1 = {1, 0, 1, 1};
  EXPECT_EQ(expected0, counts.Row(0));
  EXPECT_EQ(expected1, counts.Row(1));
  EXPECT_EQ(3, counts.GetDocLength(0));
  EXPECT_EQ(6, counts.GetTotalCount());
}

TEST(TermDocMatrixTest, RepeatedAndUnknownTokens) {
  std::vector<Document> docs = {
    {"a", "b", "a", "a", "zzz"}
  };
  Vocabulary vocab = {"b", "a"};
  TermDocMatrix counts(docs, vocab);

  EXPECT_EQ(1, counts(0, 0));
  EXPECT_EQ(3, counts(0, 1));
  EXPECT_EQ(4, counts.GetDocLength(0));
}

TEST(TermDocMatrixTest, EmptyVocabulary) {
  std::vector<Document> docs = {{"a"}, {"b", "c"}};
  Vocabulary vocab;
  TermDocMatrix counts(docs, vocab);

  EXPECT_EQ(2, counts.num_docs());
  EXPECT_EQ(0, counts.vocab_size());
  EXPECT_TRUE(counts.Row(1).empty());
  EXPECT_EQ(0, counts.GetTotalCount());
}

TEST(TermDocMatrixTest, Default) {
  TermDocMatrix counts;
  EXPECT_EQ(0, counts.num_docs());
  EXPECT_EQ(0, counts.vocab_size());
}

}  // namespace plsa
