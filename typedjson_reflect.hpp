#ifndef TYPEDJSON_REFLECT_H
#define TYPEDJSON_REFLECT_H

// Derives struct_description from BOOST_DESCRIBE_STRUCT / BOOST_DESCRIBE_CLASS
// and enum_description from magic_enum, so that described types need no
// hand-written wiring. Explicit specializations still take precedence.

#include "typedjson.hpp"

#include <boost/describe.hpp>
#include <boost/mp11.hpp>
#include <magic_enum.hpp>

#include <array>
#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace typedjson
{

namespace detail
{

// Only types whose described members are all public: fields are assigned
// from outside the type
template<typename T, bool = boost::describe::has_describe_members<T>::value>
struct is_publicly_described : std::false_type
{
};

template<typename T>
struct is_publicly_described<T, true>
: boost::mp11::mp_empty<boost::describe::describe_members<
    T,
    boost::describe::mod_private | boost::describe::mod_protected>>
{
};

template<typename T, template<typename...> class L, typename... D>
auto described_fields(L<D...>)
{
    return std::make_tuple(field(D::name, D::pointer)...);
}

} // namespace detail

template<typename T>
struct struct_description<
    T,
    std::enable_if_t<detail::is_publicly_described<T>::value>>
{
    static auto fields()
    {
        return detail::described_fields<T>(
            boost::describe::describe_members<
                T,
                boost::describe::mod_public>());
    }
};

template<typename E>
struct enum_description<E, std::enable_if_t<std::is_enum_v<E>>>
{
    static auto values()
    {
        constexpr auto entries = magic_enum::enum_entries<E>();

        std::array<std::pair<std::string_view, E>, entries.size()> result {};
        for (std::size_t i = 0; i < entries.size(); ++i)
        {
            result[i] = {entries[i].second, entries[i].first};
        }

        return result;
    }
};

} // namespace typedjson

#endif // TYPEDJSON_REFLECT_H
