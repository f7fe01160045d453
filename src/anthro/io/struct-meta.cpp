
#include "struct-meta.hpp"

#include "anthro/utils/math.hpp"

#define This MemberMetaData

namespace anthro
{
template<typename T> static const T& get_T(const void* p)
{
   return *static_cast<const T*>(p);
}

template<typename T> static T& set_T(void* p) { return *static_cast<T*>(p); }

static const MetaCompatible& get_mc(const void* p)
{
   return *static_cast<const MetaCompatible*>(p);
}

static MetaCompatible& set_mc(void* p) { return *static_cast<MetaCompatible*>(p); }

// -------------------------------------------------------------------------- eq
//
bool This::eq(const void* u, const void* v) const noexcept
{
   if(!important_in_eq_) return true;
   const void* a = cptr_(u);
   const void* b = cptr_(v);

#define CASE_1(TYPE, t) \
   case meta_type::TYPE: return get_T<t>(a) == get_T<t>(b)

#define CASE_2(TYPE, t)                                             \
   case meta_type::TYPE:                                            \
      return (std::isnan(get_T<t>(a)) and std::isnan(get_T<t>(b))) \
             or is_close<t>(get_T<t>(a), get_T<t>(b))

   switch(type_) {
      CASE_1(BOOL, bool);
      CASE_1(INT, int);
      CASE_1(UNSIGNED, unsigned);
      CASE_2(FLOAT, float);
      CASE_2(REAL, real);
      CASE_1(STRING, string);
      CASE_1(JSON_VALUE, Json::Value);
   case meta_type::COMPATIBLE_OBJECT: return get_mc(a) == get_mc(b);
   }

#undef CASE_1
#undef CASE_2
   return false;
}

// ------------------------------------------------------------------- to_stream
//
std::ostream& This::to_stream(const void* x, std::ostream& ss, int indent) const
    noexcept(false)
{
   const void* p = cptr_(x);

   switch(type_) {
   case meta_type::BOOL: ss << str(get_T<bool>(p)); break;
   case meta_type::INT: ss << get_T<int>(p); break;
   case meta_type::UNSIGNED: ss << get_T<unsigned>(p); break;
   case meta_type::FLOAT: ss << json_encode(get_T<float>(p)); break;
   case meta_type::REAL: ss << json_encode(get_T<real>(p)); break;
   case meta_type::STRING: ss << json_encode(get_T<string>(p)); break;
   case meta_type::JSON_VALUE: {
      Json::StreamWriterBuilder builder;
      builder["indentation"] = "";
      ss << Json::writeString(builder, get_T<Json::Value>(p));
   } break;
   case meta_type::COMPATIBLE_OBJECT: get_mc(p).to_stream(ss, indent); break;
   }

   return ss;
}

// --------------------------------------------------------------------- to_json
//
Json::Value This::to_json(const void* x) const noexcept(false)
{
   const void* p = cptr_(x);

#define CASE(TYPE, t) \
   case meta_type::TYPE: return json_save(get_T<t>(p))

   switch(type_) {
      CASE(BOOL, bool);
      CASE(INT, int);
      CASE(UNSIGNED, unsigned);
      CASE(FLOAT, float);
      CASE(REAL, real);
      CASE(STRING, string);
   case meta_type::JSON_VALUE: return get_T<Json::Value>(p);
   case meta_type::COMPATIBLE_OBJECT: return get_mc(p).to_json();
   }
#undef CASE

   return Json::Value{Json::nullValue};
}

// ------------------------------------------------------------------------ read
//
void This::read(void* x,
                const Json::Value& o,
                const void* defaults,
                const string_view path,
                const bool print_warnings) const noexcept(false)
{
   void* p = ptr_(x);

#define CASE(TYPE, t) \
   case meta_type::TYPE: json_load(o, set_T<t>(p)); break

   switch(type_) {
      CASE(BOOL, bool);
      CASE(INT, int);
      CASE(UNSIGNED, unsigned);
      CASE(FLOAT, float);
      CASE(REAL, real);
      CASE(STRING, string);
   case meta_type::JSON_VALUE: set_T<Json::Value>(p) = o; break;
   case meta_type::COMPATIBLE_OBJECT:
      set_mc(p).read_with_defaults(
          o,
          (defaults == nullptr) ? nullptr : &get_mc(cptr_(defaults)),
          print_warnings,
          path);
      break;
   }

#undef CASE
}

// ---------------------------------------------------------------------- detail
//
namespace detail
{
   static bool eq_with_meta(const vector<MemberMetaData>& meta_data,
                            const void* a,
                            const void* b) noexcept
   {
      if(a == b) return true;
      for(const auto& m : meta_data)
         if(!m.eq(a, b)) return false;
      return true;
   }

   static std::ostream& to_stream_with_meta(std::ostream& ss,
                                            const vector<MemberMetaData>& meta,
                                            const void* o,
                                            int indent) noexcept(false)
   {
      auto do_indent = [&](int val) {
         for(auto i = 0; i < (3 * val); ++i) ss << ' ';
      };

      ss << "{";
      bool first = true;
      for(const auto& m : meta) {
         if(first)
            first = false;
         else
            ss << ',';
         ss << '\n';
         do_indent(indent + 1);
         ss << '"' << m.name() << "\": ";
         m.to_stream(o, ss, indent + 1);
      }
      if(!first) {
         ss << '\n';
         do_indent(indent);
      }
      ss << "}";
      return ss;
   }

   static Json::Value to_json_with_meta(const vector<MemberMetaData>& meta,
                                        const void* x) noexcept(false)
   {
      Json::Value o{Json::objectValue};
      for(const auto& m : meta) {
         Expects(!has_key(o, m.name()));
         o[m.name()] = m.to_json(x);
      }
      return o;
   }

   static void read_json_with_meta(const vector<MemberMetaData>& meta,
                                   void* x,
                                   const Json::Value& o) noexcept(false)
   {
      for(const auto& m : meta) {
         if(!has_key(o, m.name()))
            throw std::runtime_error(
                format("failed to find key '{}'", m.name()));
         m.read(x, o[m.name()], nullptr, m.name(), false);
      }
   }

   static void
   read_json_with_meta_and_defaults(const vector<MemberMetaData>& meta,
                                    void* x,
                                    const Json::Value& o,
                                    const void* defaults,
                                    const string_view path,
                                    const bool print_warnings) noexcept(false)
   {
      auto get_path = [&](const string_view name) {
         const char* delim = (path.size() == 0) ? "" : ".";
         return format("{}{}{}", path, delim, name);
      };

      if(!o.isObject() and !o.isNull())
         throw std::runtime_error(
             format("expected a JSON object at '{}'", path));

      for(const auto& m : meta) {
         string reason = ""s;
         if(!has_key(o, m.name())) {
            reason = "key not found"s;
         } else {
            try {
               m.read(
                   x, o[m.name()], defaults, get_path(m.name()), print_warnings);
            } catch(std::runtime_error& e) {
               if(defaults == nullptr)
                  throw std::runtime_error(format(
                      "error reading '{}': {}", get_path(m.name()), e.what()));
               reason = e.what();
            }
         }

         if(reason.empty()) continue;

         if(defaults != nullptr) {
            m.read(x, m.to_json(defaults), defaults, get_path(m.name()), false);
            if(print_warnings and !k_is_testcase_build)
               WARN(format("{}: using default value for '{}'",
                           reason,
                           get_path(m.name())));
         }
      }
   }

} // namespace detail

// -------------------------------------------------- MetaCompatible::operator==
//
bool MetaCompatible::operator==(const MetaCompatible& o) const noexcept
{
   if(this == &o) return true;
   const auto& A = meta_data();
   const auto& B = o.meta_data();
   if(&A != &B) return false;
   return detail::eq_with_meta(A, this, &o);
}

bool MetaCompatible::operator!=(const MetaCompatible& o) const noexcept
{
   return !(*this == o);
}

std::ostream& MetaCompatible::to_stream(std::ostream& ss, int indent) const
    noexcept
{
   try {
      return detail::to_stream_with_meta(ss, this->meta_data(), this, indent);
   } catch(std::exception& e) {
      LOG_ERR(format("exception streaming object: {}", e.what()));
   }
   return ss;
}

string MetaCompatible::to_json_string(int indent) const noexcept
{
   std::stringstream ss{""};
   to_stream(ss, indent);
   return ss.str();
}

string MetaCompatible::to_string(int indent) const noexcept
{
   return to_json_string(indent);
}

Json::Value MetaCompatible::to_json() const noexcept
{
   try {
      return detail::to_json_with_meta(this->meta_data(), this);
   } catch(std::exception& e) {
      LOG_ERR(format("exception writing json: {}", e.what()));
   }
   return Json::Value{Json::nullValue};
}

void MetaCompatible::read(const Json::Value& val) noexcept(false)
{
   detail::read_json_with_meta(this->meta_data(), this, val);
}

void MetaCompatible::read_with_defaults(const Json::Value& val,
                                        const MetaCompatible* defaults,
                                        const bool print_warnings,
                                        const string_view path) noexcept(false)
{
   detail::read_json_with_meta_and_defaults(
       this->meta_data(), this, val, defaults, path, print_warnings);
}

} // namespace anthro
