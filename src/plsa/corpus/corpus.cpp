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

#include <plsa/corpus/corpus.hpp>
#include <glog/logging.h>
#include <fstream>
#include <sstream>
#include <utility>

namespace plsa {

Corpus::Corpus() : num_tokens_(0), num_empty_docs_(0) { }

void Corpus::ReadFile(const std::string& doc_file) {
  std::ifstream is(doc_file.c_str());
  CHECK(is) << "Failed to open " << doc_file;
  Read(is);
  is.close();
}

void Corpus::Read(std::istream& in) {
  Clear();
  std::string line;
  while (std::getline(in, line)) {
    std::stringstream linestream(line);
    Document doc;
    std::string token;
    while (linestream >> token) {
      doc.push_back(token);
    }
    if (doc.empty()) {
      LOG(WARNING) << "Doc " << docs_.size() << " (line " << docs_.size() + 1
        << ") has no tokens.";
      ++num_empty_docs_;
    }
    num_tokens_ += doc.size();
    docs_.push_back(std::move(doc));
  }
  BuildVocabulary();
  VLOG(1) << "Read " << docs_.size() << " docs, " << num_tokens_
    << " tokens, " << vocab_.size() << " unique terms";
}

int32_t Corpus::GetWordId(const std::string& term) const {
  auto it = word_ids_.find(term);
  return (it == word_ids_.end()) ? -1 : it->second;
}

void Corpus::Clear() {
  docs_.clear();
  vocab_.clear();
  word_ids_.clear();
  num_tokens_ = 0;
  num_empty_docs_ = 0;
}

void Corpus::BuildVocabulary() {
  for (const Document& doc : docs_) {
    for (const std::string& term : doc) {
      if (word_ids_.find(term) == word_ids_.end()) {
        word_ids_[term] = vocab_.size();
        vocab_.push_back(term);
      }
    }
  }
}

}  // namespace plsa
