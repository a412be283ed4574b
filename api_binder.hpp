#pragma once
#ifndef YA_XDCC_API_BINDER_HPP_
#define YA_XDCC_API_BINDER_HPP_

#include <chrono>
#include <cstdint>
// string_view
#if __has_include(<string_view>)
#include <string_view>
namespace api{
using std::basic_string_view;
using string_view = std::string_view;
}
#else
#include "boost/utility/string_view.hpp"
namespace api{
using boost::basic_string_view;
using string_view = boost::string_view;
}
#endif
// end of string_view

// optional
#if __has_include(<optional>)
#include <optional>
namespace api{
using std::optional;
using std::nullopt;
using std::in_place;
}
#else
#include "boost/optional.hpp"
namespace api{
using boost::optional;
constexpr auto nullopt = boost::none;
using boost::optional::in_place;
}
#endif
// end of optional

// variant
#if __has_include(<variant>)
#include <variant>
namespace api{
using std::variant;
using std::holds_alternative;
using std::get;
}
#else
#include "boost/variant.hpp"
namespace api{
using boost::variant;
template <typename T, typename... Ts>
bool holds_alternative(const boost::variant<Ts...>& v) noexcept
{
    return boost::get<T>(&v) != nullptr;
}
using boost::get;
}
#endif
// end of variant

// filesystem
#if __has_include(<filesystem>)
#include <filesystem>
namespace api{
namespace fs = std::filesystem;
using error_code = std::error_code;
using errc = std::errc;
}
#elif __has_include("boost/filesystem.hpp")
#include "boost/filesystem.hpp"
namespace api{
namespace fs = boost::filesystem;
using error_code = boost::system::error_code;
using errc = boost::system::errc::errc_t;
}
#endif

#ifdef _MSC_VER
#include <iso646.h>
#endif

#endif
