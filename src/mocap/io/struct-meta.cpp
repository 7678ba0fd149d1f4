#include "struct-meta.hpp"

#include "mocap/io/json-io.hpp"

#include <stdexcept>
#include <type_traits>

#define This MemberMetaData

namespace mocap
{
template<typename T> struct type_tag
{
   using type = T;
};

// Calls `f(type_tag<T>{})`, where T is the C++ type of meta-type `t`
template<typename F> static auto dispatch(const meta_type t, F&& f)
{
   switch(t) {
   case meta_type::BOOL: return f(type_tag<bool>{});
   case meta_type::INT: return f(type_tag<int>{});
   case meta_type::REAL: return f(type_tag<real>{});
   case meta_type::STRING: return f(type_tag<string>{});
   case meta_type::COMPATIBLE_OBJECT: return f(type_tag<MetaCompatible>{});
   }
   throw std::logic_error(format("unknown meta_type {}", int(t)));
}

template<typename T>
constexpr bool is_object_v = std::is_same_v<T, MetaCompatible>;

static bool is_close(real a, real b) noexcept
{
   if(std::isnan(a) || std::isnan(b)) return std::isnan(a) && std::isnan(b);
   return std::fabs(a - b) <= std::numeric_limits<real>::epsilon()
                                  * std::max(1.0, std::fabs(a + b));
}

const void* This::get_ptr_(const void* o) const noexcept
{
   return static_cast<const char*>(o) + offset_;
}

void* This::set_ptr_(void* o) const noexcept
{
   return static_cast<char*>(o) + offset_;
}

template<typename T> T This::get_(const void* o) const noexcept(false)
{
   return getter_ ? std::any_cast<T>(getter_(o))
                  : *static_cast<const T*>(get_ptr_(o));
}

template<typename T> void This::set_(void* o, T value) const noexcept(false)
{
   if(setter_)
      setter_(o, std::any(std::move(value)));
   else
      *static_cast<T*>(set_ptr_(o)) = std::move(value);
}

// ---------------------------------------------------------------- construction
//
This::This(meta_type t,
           std::string member_name,
           bool eq,
           int off,
           get_fun gf,
           set_fun sf) noexcept
    : type_(t)
    , offset_(off)
    , getter_(std::move(gf))
    , setter_(std::move(sf))
    , name_(std::move(member_name))
    , important_in_eq_(eq)
{
   Expects(getter_ != nullptr or offset_ >= 0);
   Expects(setter_ != nullptr or offset_ >= 0);
   Expects(type_ != meta_type::COMPATIBLE_OBJECT or offset_ >= 0);
}

// -------------------------------------------------------------------------- eq
//
bool This::eq(const void* u, const void* v) const noexcept(false)
{
   if(!important_in_eq_) return true;
   return dispatch(type_, [&](auto tag) -> bool {
      using T = typename decltype(tag)::type;
      if constexpr(is_object_v<T>)
         return *static_cast<const T*>(get_ptr_(u))
                == *static_cast<const T*>(get_ptr_(v));
      else if constexpr(std::is_floating_point_v<T>)
         return is_close(get_<T>(u), get_<T>(v));
      else
         return get_<T>(u) == get_<T>(v);
   });
}

// ------------------------------------------------------------------- to_stream
//
// Writes valid json: strings quoted, non-finite reals as null.
std::ostream& This::to_stream(const void* x, std::ostream& ss, int indent) const
    noexcept(false)
{
   dispatch(type_, [&](auto tag) {
      using T = typename decltype(tag)::type;
      if constexpr(is_object_v<T>)
         static_cast<const T*>(get_ptr_(x))->to_stream(ss, indent);
      else if constexpr(std::is_same_v<T, bool>)
         ss << str(get_<T>(x));
      else if constexpr(std::is_same_v<T, int>)
         ss << get_<T>(x);
      else
         ss << json_encode(get_<T>(x));
   });
   return ss;
}

// --------------------------------------------------------------------- to_json
//
Json::Value This::to_json(const void* x) const noexcept(false)
{
   return dispatch(type_, [&](auto tag) -> Json::Value {
      using T = typename decltype(tag)::type;
      if constexpr(is_object_v<T>)
         return static_cast<const T*>(get_ptr_(x))->to_json();
      else
         return json_save(get_<T>(x));
   });
}

// ------------------------------------------------------------------------ read
//
void This::read(void* x,
                const Json::Value& o,
                const string_view path,
                const bool print_warnings) const noexcept(false)
{
   dispatch(type_, [&](auto tag) {
      using T = typename decltype(tag)::type;
      if constexpr(is_object_v<T>) {
         static_cast<T*>(set_ptr_(x))->read_with_defaults(
             o, nullptr, print_warnings, path);
      } else {
         T value;
         json_load(o, value);
         set_(x, std::move(value));
      }
   });
}

// ------------------------------------------------------------- detail helpers
//
namespace detail
{
   static bool eq_with_meta(const vector<MemberMetaData>& meta_data,
                            const void* a,
                            const void* b) noexcept
   {
      if(a == b) return true;
      try {
         return std::all_of(cbegin(meta_data),
                            cend(meta_data),
                            [&](const auto& m) { return m.eq(a, b); });
      } catch(std::bad_any_cast& e) {
         LOG_ERR(format("bad any cast comparing objects: {}", e.what()));
      }
      return false;
   }

   static std::ostream&
   to_stream_with_meta(std::ostream& ss,
                       const vector<MemberMetaData>& meta_data,
                       const void* o,
                       int indent) noexcept
   {
      const string pad0(size_t(3 * indent), ' ');
      const string pad1(size_t(3 * (indent + 1)), ' ');

      ss << "{";
      for(size_t i = 0; i < meta_data.size(); ++i) {
         const auto& m = meta_data[i];
         ss << (i == 0 ? "\n" : ",\n") << pad1 << '"' << m.name() << "\": ";
         m.to_stream(o, ss, indent + 1);
      }
      if(!meta_data.empty()) ss << '\n' << pad0;
      ss << "}";
      return ss;
   }

   static Json::Value to_json_with_meta(const vector<MemberMetaData>& meta_data,
                                        const void* x) noexcept
   {
      Json::Value o{Json::objectValue};
      for(const auto& m : meta_data) {
         Expects(!has_key(o, m.name()));
         o[m.name()] = m.to_json(x);
      }
      return o;
   }

   // Every member must be present
   static void read_json_with_meta(const vector<MemberMetaData>& meta_data,
                                   void* x,
                                   const Json::Value& o) noexcept(false)
   {
      for(const auto& m : meta_data) {
         if(!has_key(o, m.name()))
            throw std::runtime_error(
                format("failed to find key '{}'", m.name()));
         m.read(x, o[m.name()]);
      }
   }

   // Missing or bad members are taken from `defaults`. When `defaults` is
   // nullptr, missing members keep their current value, and bad members throw.
   static void
   read_json_with_meta_and_defaults(const vector<MemberMetaData>& meta_data,
                                    void* x,
                                    const Json::Value& o,
                                    const void* defaults,
                                    const string_view path,
                                    const bool print_warnings)
   {
      auto get_path = [&](const string_view name) {
         return path.empty() ? string(name) : format("{}.{}", path, name);
      };

      for(const auto& m : meta_data) {
         bool use_default = !has_key(o, m.name());
         if(!use_default) {
            try {
               m.read(x, o[m.name()], get_path(m.name()), print_warnings);
            } catch(std::runtime_error& e) {
               if(defaults == nullptr)
                  throw std::runtime_error(format("error reading '{}': {}",
                                                  get_path(m.name()),
                                                  e.what()));
               use_default = true;
            }
         }

         if(!use_default) continue;
         if(defaults != nullptr) m.read(x, m.to_json(defaults));
         if(print_warnings and !k_is_testcase_build)
            WARN(format("using default value for '{}'", get_path(m.name())));
      }
   }

} // namespace detail

// -------------------------------------------------------------- MetaCompatible
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
   return detail::to_stream_with_meta(ss, this->meta_data(), this, indent);
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
   return detail::to_json_with_meta(this->meta_data(), this);
}

void MetaCompatible::read(const Json::Value& val) noexcept(false)
{
   detail::read_json_with_meta(this->meta_data(), this, val);
}

void MetaCompatible::read_with_defaults(const Json::Value& val,
                                        const MetaCompatible* defaults,
                                        const bool print_warnings,
                                        const string_view path)
{
   detail::read_json_with_meta_and_defaults(
       this->meta_data(), this, val, defaults, path, print_warnings);
}

} // namespace mocap
