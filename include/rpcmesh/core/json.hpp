// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace rpcmesh
{
namespace core
{
/// JSON type alias to avoid exposing third-party namespaces.
using Json = nlohmann::json;

/// \brief Parse text without throwing; nullopt on malformed input.
inline std::optional<Json> tryParseJson(const std::string &text)
{
  Json value = Json::parse(text, nullptr, false);
  if (value.is_discarded())
  {
    return std::nullopt;
  }
  return value;
}

/// \brief Compact dump clipped to maxLength characters for log lines.
inline std::string jsonPreview(const Json &value, std::size_t maxLength = 256)
{
  std::string text = value.dump(-1, ' ', false, Json::error_handler_t::replace);
  if (text.size() > maxLength)
  {
    text.resize(maxLength);
    text += "...";
  }
  return text;
}

} // namespace core
} // namespace rpcmesh
