//
// Described-struct <-> JSON conversion used by the archive DTOs.
//

#ifndef HTTPREC_RECORDER_DTO_TAGINVOKE_HPP
#define HTTPREC_RECORDER_DTO_TAGINVOKE_HPP

#include <boost/json.hpp>
#include <boost/describe.hpp>
#include <boost/mp11.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace boost::json
{
  namespace desc = boost::describe;
  namespace mp11 = boost::mp11;

  template <class T>
  struct is_optional_member : std::false_type
  {
  };

  template <class T>
  struct is_optional_member<std::optional<T>> : std::true_type
  {
  };

  // =================================================================
  // 1. Struct -> JSON
  //    空的 std::optional 成员直接省略，不输出 null
  // =================================================================
  template <class T>
  auto tag_invoke(value_from_tag, value& jv, T const& t)
    -> std::enable_if_t<desc::has_describe_members<T>::value>
  {
    auto& obj = jv.emplace_object();

    using Md = desc::describe_members<T, desc::mod_public>;

    mp11::mp_for_each<Md>([&](auto D)
    {
      using MemberT = std::remove_cv_t<std::remove_reference_t<decltype(t.*D.pointer)>>;

      if constexpr (is_optional_member<MemberT>::value)
      {
        if ((t.*D.pointer).has_value())
        {
          obj.emplace(D.name, value_from(*(t.*D.pointer)));
        }
      }
      else
      {
        obj.emplace(D.name, value_from(t.*D.pointer));
      }
    });
  }

  // =================================================================
  // 2. JSON -> Struct
  //    非 optional 成员是必填字段，缺失时抛出 std::invalid_argument
  // =================================================================
  template <class T>
  auto tag_invoke(value_to_tag<T>, value const& jv)
    -> std::enable_if_t<desc::has_describe_members<T>::value, T>
  {
    T t{};

    // 不是 object 时 as_object() 抛出异常，这是符合预期的行为
    auto const& obj = jv.as_object();

    using Md = desc::describe_members<T, desc::mod_public>;

    mp11::mp_for_each<Md>([&](auto D)
    {
      using MemberT = std::remove_reference_t<decltype(t.*D.pointer)>;

      auto it = obj.find(D.name);
      if constexpr (is_optional_member<MemberT>::value)
      {
        if (it != obj.end() && !it->value().is_null())
        {
          t.*D.pointer = value_to<typename MemberT::value_type>(it->value());
        }
      }
      else
      {
        if (it == obj.end())
        {
          throw std::invalid_argument(std::string("missing required field '") + D.name + "'");
        }
        t.*D.pointer = value_to<MemberT>(it->value());
      }
    });

    return t;
  }
} // namespace boost::json

#endif //HTTPREC_RECORDER_DTO_TAGINVOKE_HPP
