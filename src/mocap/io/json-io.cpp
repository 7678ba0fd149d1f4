#include "json-io.hpp"

namespace mocap
{
// ------------------------------------------------------------------------ Load
//
void json_load(const Json::Value& node, bool& v) noexcept(false)
{
   if(!node.isBool()) throw std::runtime_error("expected boolean value");
   v = node.asBool();
}

void json_load(const Json::Value& node, int& v) noexcept(false)
{
   if(!node.isInt()) throw std::runtime_error("expected integer value");
   v = node.asInt();
}

void json_load(const Json::Value& node, double& v) noexcept(false)
{
   if(node.isNull())
      v = dNAN;
   else if(node.isNumeric())
      v = node.asDouble();
   else
      throw std::runtime_error("expected numeric value");
}

void json_load(const Json::Value& node, float& v) noexcept(false)
{
   double x = dNAN;
   json_load(node, x);
   v = float(x);
}

void json_load(const Json::Value& node, std::string& v) noexcept(false)
{
   if(!node.isString()) throw std::runtime_error("expected string value");
   v = node.asString();
}

// ------------------------------------------------------------------------ Save
//
Json::Value json_save(const bool& x) noexcept { return Json::Value(x); }
Json::Value json_save(const int& x) noexcept { return Json::Value(x); }
Json::Value json_save(const double& x) noexcept
{
   return std::isfinite(x) ? Json::Value(x) : Json::Value(Json::nullValue);
}
Json::Value json_save(const string& s) noexcept { return Json::Value(s); }

// ------------------------------------------------------------------ Parse JSON

Json::Value parse_json(const std::string& s) noexcept(false)
{
   static thread_local Json::CharReaderBuilder json_parser_builder_;
   auto reader
       = unique_ptr<Json::CharReader>(json_parser_builder_.newCharReader());

   Json::Value root;
   std::string err = "";

   try {
      if(!reader->parse(s.data(), s.data() + s.size(), &root, &err)
         && err.empty())
         err = "parse error";
      if(err != "") err = format("error reading JSON data: {}", err);
   } catch(std::exception& e) {
      err = format("error reading JSON data: {}", e.what());
   }

   if(err != "") throw std::runtime_error(err);
   return root;
}

bool parse_json(const string& s, Json::Value& val) noexcept
{
   try {
      val = parse_json(s);
      return true;
   } catch(std::exception&) {
      // do nothing
   }
   return false;
}

} // namespace mocap
