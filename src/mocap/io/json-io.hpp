#pragma once

#include "json/json.h"

#include "mocap/foundation.hpp"

namespace mocap
{
// ------------------------------------------------------------------- load/save
//
// `json_load` throws std::runtime_error on a type mismatch. Non-finite reals
// save as `null`, and `null` loads as NaN.
void json_load(const Json::Value& node, bool&) noexcept(false);
void json_load(const Json::Value& node, int&) noexcept(false);
void json_load(const Json::Value& node, float&) noexcept(false);
void json_load(const Json::Value& node, double&) noexcept(false);
void json_load(const Json::Value& node, std::string&) noexcept(false);

Json::Value json_save(const bool&) noexcept;
Json::Value json_save(const int&) noexcept;
Json::Value json_save(const double&) noexcept;
Json::Value json_save(const string&) noexcept;

// Compact single-line encoding, e.g., `"abc"` or `1.5`
template<typename T> inline string json_encode(const T& o)
{
   Json::StreamWriterBuilder builder;
   builder["indentation"] = "";
   return Json::writeString(builder, json_save(o));
}

inline bool has_key(const Json::Value& node, const string_view key)
{
   return node.isObject() && node.isMember(key.data(), key.data() + key.size());
}

// ------------------------------------------------------------------ parse json
//
Json::Value parse_json(const string& s) noexcept(false);

// RETURN true if parsing was successful
bool parse_json(const string& s, Json::Value& val) noexcept;

inline string str(const Json::Value& o) noexcept
{
   std::stringstream ss{""s};
   ss << o;
   return ss.str();
}

} // namespace mocap
