#pragma once

#include <any>

#include "mocap/io/json-io.hpp"
#include "mocap/utils/file-system.hpp"
#include "mocap/utils/string-utils.hpp"
#include "json/json.h"

/**
 * Example Usage

struct Params final : public MetaCompatible
{
   virtual ~Params() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   int model_complexity = 1;
   bool feedback        = false;
};

//
// In cpp file
//
const vector<MemberMetaData>& Params::meta_data() const noexcept
{
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(Params, INT, model_complexity, true));
      m.push_back(MAKE_META(Params, BOOL, feedback, false));
      return m;
   };
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
}

//
// Now we have:
//
void some_fun()
{
   Params p;
   Json::Value o = p.to_json();
   cout << str(p) << endl;
   p.read_with_defaults<Params>(o);
}

// @see `struct-meta_tc.cpp` for more usage

*/

namespace mocap
{
// ------------------------------------------------------------- Meta Compatible
//
// BOOL, INT, REAL, and STRING map to bool, int, real, and string.
// COMPATIBLE_OBJECT is a nested MetaCompatible, read with the defaults
// of its enclosing object.
enum class meta_type : int { BOOL = 0, INT, REAL, STRING, COMPATIBLE_OBJECT };

struct MetaCompatible;

// -------------------------------------------------------------- MemberMetaData
//
struct MemberMetaData
{
   using get_fun = std::function<std::any(const void*)>;
   using set_fun = std::function<void(void*, const std::any&)>;

 private:
   template<typename T1, typename T2> static int offset_of(T1 T2::*member)
   {
      static T2 object{};
      return int(size_t(&(object.*member)) - size_t(&object));
   }

   meta_type type_       = meta_type::BOOL;
   int offset_           = -1;
   get_fun getter_       = nullptr; // Uses 'offset' if nullptr
   set_fun setter_       = nullptr; // Uses 'offset' if nullptr
   std::string name_     = ""s;
   bool important_in_eq_ = true;

   const void* get_ptr_(const void* o) const noexcept;
   void* set_ptr_(void* o) const noexcept;
   template<typename T> T get_(const void* o) const noexcept(false);
   template<typename T> void set_(void* o, T value) const noexcept(false);

   MemberMetaData(meta_type t,
                  string member_name,
                  bool eq,
                  int off    = -1,
                  get_fun gf = nullptr,
                  set_fun sf = nullptr) noexcept;

 public:
   MemberMetaData(meta_type t, string name, bool eq, get_fun gf, set_fun sf)
       : MemberMetaData(t, name, eq, -1, gf, sf)
   {}

   template<typename T1, typename T2>
   MemberMetaData(meta_type t,
                  string name,
                  bool eq,
                  T1 T2::*member,
                  get_fun gf = nullptr,
                  set_fun sf = nullptr)
       : MemberMetaData(t, name, eq, offset_of(member), gf, sf)
   {}

   // Getters
   meta_type type() const noexcept { return type_; }
   const string& name() const noexcept { return name_; }
   bool important_in_eq() const noexcept { return important_in_eq_; }

   // Operations
   bool eq(const void* u, const void* v) const noexcept(false);
   std::ostream& to_stream(const void* x, std::ostream& ss, int indent) const
       noexcept(false);
   Json::Value to_json(const void* u) const noexcept(false);
   void read(void* x,
             const Json::Value& o,
             const string_view path   = ""s,
             const bool print_warnings = false) const noexcept(false);
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
   void read(const Json::Value& val) noexcept(false);

   void read_with_defaults(const Json::Value& val,
                           const MetaCompatible* defaults,
                           const bool print_warnings = true,
                           const string_view path    = ""s);

   // read_with_defaults<Params>(json_object);
   template<typename T>
   void read_with_defaults(const Json::Value& val,
                           const bool print_warnings = true,
                           const string_view path    = ""s)
   {
      T defaults;
      read_with_defaults(val, &defaults, print_warnings, path);
   }

   friend string str(const MetaCompatible& o) noexcept { return o.to_string(); }
};

#define META_READ_WRITE_LOAD_SAVE(TYPE_)                                    \
   inline void read(TYPE_& data, const Json::Value& node) noexcept(false)   \
   {                                                                        \
      TYPE_ defaults;                                                       \
      data.read_with_defaults(node, &defaults);                             \
   }                                                                        \
   inline void read(TYPE_& data, const std::string& in) noexcept(false)     \
   {                                                                        \
      read(data, parse_json(in));                                           \
   }                                                                        \
   inline void write(const TYPE_& data, std::string& out) noexcept(false)   \
   {                                                                        \
      out = data.to_json_string();                                          \
   }                                                                        \
   inline void write(const TYPE_& data, Json::Value& node) noexcept(false)  \
   {                                                                        \
      node = data.to_json();                                                \
   }                                                                        \
   inline void load(TYPE_& data, const string& fname) noexcept(false)       \
   {                                                                        \
      read(data, file_get_contents(fname));                                 \
   }                                                                        \
   inline void save(const TYPE_& data, const string& fname) noexcept(false) \
   {                                                                        \
      std::string s;                                                        \
      write(data, s);                                                       \
      const auto ec = file_put_contents(fname, s);                          \
      if(ec)                                                                \
         throw std::runtime_error(                                          \
             format("failed to write '{}': {}", fname, ec.message()));      \
   }

} // namespace mocap
