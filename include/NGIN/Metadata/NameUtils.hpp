// NameUtils.hpp
// Type ids and schema parameter names derived from compiler signatures.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <NGIN/Metadata/Export.hpp>

#include <string_view>
#include <type_traits>

namespace NGIN::Metadata::detail
{

  // Intern a string into the process-wide name storage and return a stable view.
  NGIN_METADATA_API std::string_view InternName(std::string_view s) noexcept;

  template <class T>
  [[nodiscard]] constexpr std::string_view TypeNameOf() noexcept
  {
    return NGIN::Meta::TypeName<std::remove_cvref_t<T>>::qualifiedName;
  }

  template <class T>
  [[nodiscard]] inline NGIN::UInt64 TypeIdOf()
  {
    const auto sv = TypeNameOf<T>();
    return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
  }

  [[nodiscard]] inline NGIN::UInt64 TypeIdOfName(std::string_view qualifiedName)
  {
    return NGIN::Hashing::FNV1a64(qualifiedName.data(), qualifiedName.size());
  }

  // Slice "Class::member" out of a pretty signature, from `key` up to the first of `terminators`.
  [[nodiscard]] constexpr std::string_view SliceSignature(std::string_view sig, std::string_view key, std::string_view terminators) noexcept
  {
    const auto kpos = sig.find(key);
    if (kpos == std::string_view::npos)
      return {};
    const auto start = kpos + key.size();
    const auto end = sig.find_first_of(terminators, start);
    if (end == std::string_view::npos || end <= start)
      return {};
    return sig.substr(start, end - start);
  }

  // Identifier of the data member a schema parameter is bound to, e.g. "gets" for &RestMeta::gets.
  template <auto MemberPtr>
  [[nodiscard]] consteval std::string_view ParamNameOf() noexcept
  {
#if defined(_MSC_VER)
    constexpr auto full = SliceSignature(__FUNCSIG__, "ParamNameOf<&", ">");
#elif defined(__clang__)
    constexpr auto full = SliceSignature(__PRETTY_FUNCTION__, "[MemberPtr = &", ";]");
#elif defined(__GNUC__)
    constexpr auto full = SliceSignature(__PRETTY_FUNCTION__, "[with auto MemberPtr = &", ";]");
#else
    constexpr std::string_view full{};
#endif
    const auto dc = full.rfind("::");
    if (dc == std::string_view::npos)
      return full;
    return full.substr(dc + 2);
  }

} // namespace NGIN::Metadata::detail
