#include <NGIN/Metadata/Annotations.hpp>
#include <NGIN/Metadata/NameUtils.hpp>

namespace NGIN::Metadata
{

  Annotation &Annotation::With(std::string_view key, AttrValue value) &
  {
    if (auto *s = std::get_if<std::string_view>(&value))
      value = AttrValue{std::in_place_type<std::string_view>, detail::InternName(*s)};
    const auto k = detail::InternName(key);
    for (NGIN::UIntSize i = 0; i < m_args.Size(); ++i)
    {
      if (m_args[i].key == k)
      {
        m_args[i].value = std::move(value);
        return *this;
      }
    }
    m_args.PushBack(AttributeDesc{k, std::move(value)});
    return *this;
  }

  std::optional<AttrValue> Annotation::Find(std::string_view key) const
  {
    for (NGIN::UIntSize i = 0; i < m_args.Size(); ++i)
      if (m_args[i].key == key)
        return m_args[i].value;
    return std::nullopt;
  }

  std::optional<std::string_view> Annotation::FindString(std::string_view key) const
  {
    auto v = Find(key);
    if (!v)
      return std::nullopt;
    if (auto *s = std::get_if<std::string_view>(&*v))
      return *s;
    return std::nullopt;
  }

  bool operator==(const Annotation &a, const Annotation &b)
  {
    if (a.m_type != b.m_type || a.m_args.Size() != b.m_args.Size())
      return false;
    for (NGIN::UIntSize i = 0; i < a.m_args.Size(); ++i)
    {
      if (a.m_args[i].key != b.m_args[i].key || !(a.m_args[i].value == b.m_args[i].value))
        return false;
    }
    return true;
  }

} // namespace NGIN::Metadata
