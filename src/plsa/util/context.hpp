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

#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace plsa {

// An extension of google flags. It is a singleton that stores 1) google
// flags and 2) other lightweight global values derived at runtime (e.g.
// corpus sizes). Underlying data structure is a map of string to string,
// similar to google::CommandLineFlagInfo.
//
// get_instance() must first be called after google::ParseCommandLineFlags,
// since the flag values are captured on construction.
class Context {
public:
  static Context& get_instance();

  // Getters die if 'key' is neither a flag nor a value set at runtime.
  int32_t get_int32(const std::string& key) const;
  double get_double(const std::string& key) const;
  const std::string& get_string(const std::string& key) const;

  void set(const std::string& key, int32_t value);
  // Stored with full precision, so get_double returns 'value' unchanged.
  void set(const std::string& key, double value);
  void set(const std::string& key, const std::string& value);

private:
  // Private constructor. Store all the gflags values.
  Context();

  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  // Underlying data structure
  std::unordered_map<std::string, std::string> ctx_;
};

}   // namespace plsa
