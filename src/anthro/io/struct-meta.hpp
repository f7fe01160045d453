
#pragma once

#include <type_traits>

#include "anthro/io/json-io.hpp"
#include "anthro/utils/file-system.hpp"
#include "anthro/utils/string-utils.hpp"
#include "json/json.h"

/**
 * Example Usage

struct Thresholds final : public MetaCompatible
{
   virtual ~Thresholds() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   real min_confidence = 0.5;
   unsigned max_retakes = 3;
};

//
// In cpp file
//
const vector<MemberMetaData>& Thresholds::meta_data() const noexcept
{
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(Thresholds, REAL, min_confidence, true));
      m.push_back(MAKE_META(Thresholds, UNSIGNED, max_retakes, true));
      return m;
   };
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
}

//
// Now we have:
//
   Thresholds x;
   Json::Value o = x.to_json();
   cout << str(x) << endl;
   x.read_with_defaults(o, nullptr);

*/

namespace anthro
{
// ------------------------------------------------------------------- meta-type
//
enum class meta_type : int {
   BOOL = 0,
   INT,
   UNSIGNED,
   FLOAT,
   REAL,
   STRING,
   JSON_VALUE,
   COMPATIBLE_OBJECT
};

struct MetaCompatible;

// -------------------------------------------------------------- MemberMetaData
//
// Describes one member of a struct: its type, its json key, and how to reach
// it. COMPATIBLE_OBJECT members must derive from MetaCompatible.
//
struct MemberMetaData
{
   using cptr_fun = std::function<const void*(const void*)>;
   using ptr_fun  = std::function<void*(void*)>;

 private:
   meta_type type_       = meta_type::BOOL;
   cptr_fun cptr_        = nullptr;
   ptr_fun ptr_          = nullptr;
   std::string name_     = ""s;
   bool important_in_eq_ = true;

 public:
   template<typename T1, typename T2>
   MemberMetaData(meta_type t, string name, bool eq, T1 T2::*member)
       : type_(t)
       , name_(std::move(name))
       , important_in_eq_(eq)
   {
      if constexpr(std::is_base_of<MetaCompatible, T1>::value) {
         cptr_ = [member](const void* o) -> const void* {
            const MetaCompatible* p = &(static_cast<const T2*>(o)->*member);
            return p;
         };
         ptr_ = [member](void* o) -> void* {
            MetaCompatible* p = &(static_cast<T2*>(o)->*member);
            return p;
         };
      } else {
         cptr_ = [member](const void* o) -> const void* {
            return &(static_cast<const T2*>(o)->*member);
         };
         ptr_ = [member](void* o) -> void* {
            return &(static_cast<T2*>(o)->*member);
         };
      }
   }

   // Getters
   meta_type type() const noexcept { return type_; }
   const string& name() const noexcept { return name_; }
   bool important_in_eq() const noexcept { return important_in_eq_; }

   // Operations
   bool eq(const void* u, const void* v) const noexcept;
   std::ostream& to_stream(const void* x, std::ostream& ss, int indent) const
       noexcept(false);
   Json::Value to_json(const void* u) const noexcept(false);
   void read(void* x,
             const Json::Value& o,
             const void* defaults,
             const string_view path,
             const bool print_warnings) const noexcept(false);
};

#define MAKE_META(clazz, type, member, eq)            \
   {                                                  \
      meta_type::type, #member##s, eq, &clazz::member \
   }

// ------------------------------------------------------------- Meta Compatible
//
struct MetaCompatible
{
 public:
   virtual ~MetaCompatible() {}

   virtual const vector<MemberMetaData>& meta_data() const noexcept = 0;

   bool operator==(const MetaCompatible& o) const noexcept;
   bool operator!=(const MetaCompatible& o) const noexcept;
   std::ostream& to_stream(std::ostream& ss, int indent = 0) const noexcept;
   string to_string(int indent = 0) const noexcept;
   string to_json_string(int indent = 0) const noexcept;
   Json::Value to_json() const noexcept;

   // Every key must be present.
   void read(const Json::Value& val) noexcept(false);

   // Missing or malformed keys take the value in 'defaults'. When 'defaults'
   // is nullptr, the current value is kept.
   void read_with_defaults(const Json::Value& val,
                           const MetaCompatible* defaults,
                           const bool print_warnings = true,
                           const string_view path    = ""s) noexcept(false);

   // read_with_defaults<Params>(json_object);
   template<typename T>
   void read_with_defaults(const Json::Value& val,
                           const bool print_warnings = true,
                           const string_view path    = ""s) noexcept(false)
   {
      T defaults;
      read_with_defaults(val, &defaults, print_warnings, path);
   }

   friend string str(const MetaCompatible& o) noexcept { return o.to_string(); }
};

#define META_READ_WRITE_LOAD_SAVE(TYPE_)                                      \
   inline void read(TYPE_& data, const Json::Value& node) noexcept(false)     \
   {                                                                          \
      TYPE_ defaults;                                                         \
      data.read_with_defaults(node, &defaults);                               \
   }                                                                          \
   inline void read(TYPE_& data, const std::string& in) noexcept(false)       \
   {                                                                          \
      read(data, parse_json(in));                                             \
   }                                                                          \
   inline void write(const TYPE_& data, std::string& out) noexcept(false)     \
   {                                                                          \
      out = data.to_json_string();                                            \
   }                                                                          \
   inline void write(const TYPE_& data, Json::Value& node) noexcept(false)    \
   {                                                                          \
      node = data.to_json();                                                  \
   }                                                                          \
   inline void load(TYPE_& data, const string& fname) noexcept(false)         \
   {                                                                          \
      read(data, file_get_contents(fname));                                   \
   }                                                                          \
   inline void save(const TYPE_& data, const string& fname) noexcept(false)   \
   {                                                                          \
      std::string s;                                                          \
      write(data, s);                                                         \
      const auto ec = file_put_contents(fname, s);                            \
      if(ec)                                                                  \
         throw std::runtime_error(                                            \
             format("failed to write '{}': {}", fname, ec.message()));        \
   }

} // namespace anthro
