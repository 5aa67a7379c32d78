#pragma once

// Shared helpers for the JSON fact loaders

#include "NavGraph/core/result.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace NavGraph::io::detail {

inline Result<std::string> readFileToString(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    return Result<std::string>::error("File not found: " + path);
  }
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return Result<std::string>::error("Cannot open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return Result<std::string>::ok(buffer.str());
}

/**
 * @brief Parse a top-level JSON object
 *
 * Repeated keys within one object are rejected; nlohmann::json would
 * otherwise keep only the last value.
 */
inline Result<nlohmann::json> parseDocument(const std::string& text) {
  std::vector<std::set<std::string>> openObjects;
  std::optional<std::string> duplicateKey;

  nlohmann::json::parser_callback_t trackKeys =
      [&](int /*depth*/, nlohmann::json::parse_event_t event, nlohmann::json& parsed) {
        switch (event) {
        case nlohmann::json::parse_event_t::object_start:
          openObjects.emplace_back();
          break;
        case nlohmann::json::parse_event_t::object_end:
          if (!openObjects.empty()) {
            openObjects.pop_back();
          }
          break;
        case nlohmann::json::parse_event_t::key:
          if (!openObjects.empty() && parsed.is_string() &&
              !openObjects.back().insert(parsed.get<std::string>()).second && !duplicateKey) {
            duplicateKey = parsed.get<std::string>();
          }
          break;
        default:
          break;
        }
        return true;
      };

  try {
    nlohmann::json doc = nlohmann::json::parse(text, trackKeys);
    if (duplicateKey) {
      return Result<nlohmann::json>::error("Duplicate key '" + *duplicateKey +
                                           "' in JSON object");
    }
    if (!doc.is_object()) {
      return Result<nlohmann::json>::error("Top-level JSON value must be an object");
    }
    return Result<nlohmann::json>::ok(std::move(doc));
  } catch (const nlohmann::json::parse_error& e) {
    return Result<nlohmann::json>::error(std::string("JSON parse error: ") + e.what());
  }
}

/**
 * @brief Read a required string field of @p object
 * @param context Location used in error messages, e.g. "routes[3]"
 */
inline Result<std::string> requireString(const nlohmann::json& object, const char* key,
                                         const std::string& context) {
  auto it = object.find(key);
  if (it == object.end()) {
    return Result<std::string>::error(context + ": missing required field '" + key + "'");
  }
  if (!it->is_string()) {
    return Result<std::string>::error(context + ": field '" + key + "' must be a string");
  }
  std::string value = it->get<std::string>();
  if (value.empty()) {
    return Result<std::string>::error(context + ": field '" + key + "' must not be empty");
  }
  return Result<std::string>::ok(std::move(value));
}

/**
 * @brief Read an optional string field; absent and null both yield @p fallback
 */
inline Result<std::string> optionalString(const nlohmann::json& object, const char* key,
                                          const std::string& context,
                                          const std::string& fallback = "") {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return Result<std::string>::ok(fallback);
  }
  if (!it->is_string()) {
    return Result<std::string>::error(context + ": field '" + key + "' must be a string");
  }
  return Result<std::string>::ok(it->get<std::string>());
}

/**
 * @brief Read an optional array of route paths into a set
 */
inline Result<std::optional<std::set<std::string>>> optionalPathSet(const nlohmann::json& doc,
                                                                    const char* key) {
  using PathSetResult = Result<std::optional<std::set<std::string>>>;

  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) {
    return PathSetResult::ok(std::nullopt);
  }
  if (!it->is_array()) {
    return PathSetResult::error(std::string("'") + key + "' must be an array of route paths");
  }

  std::set<std::string> paths;
  for (size_t i = 0; i < it->size(); ++i) {
    const auto& item = (*it)[i];
    if (!item.is_string() || item.get<std::string>().empty()) {
      return PathSetResult::error(std::string(key) + "[" + std::to_string(i) +
                                  "]: must be a non-empty string");
    }
    paths.insert(item.get<std::string>());
  }
  return PathSetResult::ok(std::move(paths));
}

} // namespace NavGraph::io::detail
