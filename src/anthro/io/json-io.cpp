
#include "json-io.hpp"

#include "anthro/utils/math.hpp"

namespace anthro
{
// ------------------------------------------------------------------------ Load

double load_numeric(const Json::Value& elem) noexcept(false)
{
   if(elem.isNull())
      return dNAN;
   else if(!elem.isNumeric())
      throw std::runtime_error(format("expected numeric value"));
   return elem.asDouble();
}

template<typename T> void loadT(const Json::Value& node, T* v, unsigned size)
{
   if(!node.isArray()) throw std::runtime_error("expecting JSON array value");
   if(node.size() != size)
      throw std::runtime_error(format("incorrect number of elements in array "
                                      "value. Expected {}, but got {}.",
                                      size,
                                      node.size()));

   for(unsigned i = 0; i < size; ++i) v[i] = T(load_numeric(node[i]));
}

void json_load(const Json::Value& node, Vector2& v)
{
   loadT(node, v.ptr(), v.size());
}
void json_load(const Json::Value& node, Vector3& v)
{
   loadT(node, v.ptr(), v.size());
}

void json_load(const Json::Value& node, bool& v)
{
   if(!node.isBool()) throw std::runtime_error("expected boolean value");
   v = node.asBool();
}
void json_load(const Json::Value& node, int& v)
{
   if(!node.isInt()) throw std::runtime_error("expected integer value");
   v = node.asInt();
}
void json_load(const Json::Value& node, unsigned& v)
{
   if(!node.isUInt()) throw std::runtime_error("expected unsigned value");
   v = node.asUInt();
}
void json_load(const Json::Value& node, float& v)
{
   v = float(load_numeric(node));
}
void json_load(const Json::Value& node, double& v) { v = load_numeric(node); }
void json_load(const Json::Value& node, std::string& v)
{
   if(!node.isString()) throw std::runtime_error("expected string value");
   v = node.asString();
}

void json_load(const Json::Value& node, Timestamp& o)
{
   std::string s;
   json_load(node, s);
   o = Timestamp::parse(s);
}

// --------------------------------------------------------------------- Get Key

Json::Value get_key(const Json::Value& node, const char* key) noexcept(false)
{
   if(!node.isObject() or !node.isMember(key))
      throw std::runtime_error(format("array key '{}' missing", key));
   return node[key];
}

// ------------------------------------------------------------------------ Save

template<typename T> Json::Value saveT(const T* v, unsigned size)
{
   Json::Value X(Json::arrayValue);
   X.resize(size);
   for(unsigned i = 0; i < size; ++i)
      X[i] = std::isfinite(v[i]) ? Json::Value(real(v[i]))
                                 : Json::Value(Json::nullValue);
   return X;
}

Json::Value json_save(const bool& x)
{
   auto z = Json::Value(x);
   Expects(z.type() == Json::booleanValue);
   return z;
}
Json::Value json_save(const int& x) { return Json::Value(x); }
Json::Value json_save(const unsigned& x) { return Json::Value(x); }
Json::Value json_save(const float& x)
{
   return (std::isfinite(x)) ? Json::Value(double(x))
                             : Json::Value(Json::nullValue);
}
Json::Value json_save(const double& x)
{
   return (std::isfinite(x)) ? Json::Value(x) : Json::Value(Json::nullValue);
}

Json::Value json_save(const Vector2& v) { return saveT(v.ptr(), v.size()); }
Json::Value json_save(const Vector3& v) { return saveT(v.ptr(), v.size()); }

Json::Value json_save(const Timestamp& v) { return json_save(str(v)); }

// ---------------------------------------------------------------------- String

Json::Value json_save(const string& s)
{
   Json::Value node(Json::stringValue);
   node = s;
   return node;
}

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
         and err.empty())
         err = "malformed JSON";
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
   } catch(std::exception& e) {
      TRACE(format("parse-json failed: {}", e.what()));
   }
   return false;
}

} // namespace anthro
