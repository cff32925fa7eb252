// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>

#include <openssl/err.h>
#include <openssl/rand.h>

namespace rpcmesh
{
namespace core
{

/// \brief Uniform random source for load-spreading decisions. Injected so
/// weighted selections are reproducible under test.
class RandomSource
{
public:
  virtual ~RandomSource() = default;

  /// \brief Next value in [0, 1).
  virtual double nextUnit() = 0;

  /// \brief Uniform index in [0, n). n must be positive.
  std::size_t nextIndex(std::size_t n)
  {
    auto idx = static_cast<std::size_t>(nextUnit() * static_cast<double>(n));
    return idx < n ? idx : n - 1;
  }
};

/// \brief Mersenne Twister seeded once from OpenSSL's CSPRNG.
class SeededRandom : public RandomSource
{
public:
  SeededRandom() : _engine(osSeed()) {}

  explicit SeededRandom(std::uint64_t seed) : _engine(seed) {}

  double nextUnit() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _dist(_engine);
  }

private:
  static std::uint64_t osSeed()
  {
    std::uint64_t seed = 0;
    if (RAND_bytes(reinterpret_cast<unsigned char *>(&seed), sizeof(seed)) != 1)
    {
      char msg[256];
      ERR_error_string_n(ERR_get_error(), msg, sizeof(msg));
      throw std::runtime_error(std::string("SeededRandom: RAND_bytes failed: ") + msg);
    }
    return seed;
  }

  std::mutex _mutex;
  std::mt19937_64 _engine;
  std::uniform_real_distribution<double> _dist{0.0, 1.0};
};

} // namespace core
} // namespace rpcmesh
