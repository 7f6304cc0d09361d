// Annotations.hpp
// Annotation instances attached to real declarations and the annotation type hierarchy.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/NameUtils.hpp>
#include <NGIN/Metadata/Types.hpp>

#include <cstdint>
#include <optional>
#include <source_location>
#include <string_view>
#include <type_traits>
#include <variant>

namespace NGIN::Metadata
{

  // Annotation argument value type
  using AttrValue = std::variant<bool, std::int64_t, double, std::string_view, NGIN::UInt64>;

  struct AttributeDesc
  {
    std::string_view key;
    AttrValue value;
  };

  // Alias used as the externally-facing name of a method or parameter. Argument: "name".
  struct ExternalName
  {
  };

  namespace detail
  {
    template <class T, class = void>
    struct AnnotationBaseOf
    {
      using type = void;
    };
    template <class T>
    struct AnnotationBaseOf<T, std::void_t<typename T::Base>>
    {
      using type = typename T::Base;
    };

    // Idempotent; returns `id`.
    NGIN_METADATA_API AnnotationTypeId RegisterAnnotationType(std::string_view name, AnnotationTypeId id, AnnotationTypeId base);
  } // namespace detail

  // Register annotation type T (and its `Base` chain) and return its id.
  // A type refines its parent by declaring `using Base = Parent;`.
  template <class T>
  AnnotationTypeId EnsureAnnotationType()
  {
    using U = std::remove_cvref_t<T>;
    using B = typename detail::AnnotationBaseOf<U>::type;
    AnnotationTypeId base = 0;
    if constexpr (!std::is_void_v<B>)
      base = EnsureAnnotationType<B>();
    return detail::RegisterAnnotationType(detail::TypeNameOf<U>(), detail::TypeIdOf<U>(), base);
  }

  // True when `derived` is `base` or declares it (transitively) as its Base.
  [[nodiscard]] NGIN_METADATA_API bool IsRefinementOf(AnnotationTypeId derived, AnnotationTypeId base) noexcept;
  [[nodiscard]] NGIN_METADATA_API bool IsAnnotationType(AnnotationTypeId id) noexcept;
  [[nodiscard]] NGIN_METADATA_API std::string_view AnnotationTypeName(AnnotationTypeId id) noexcept;
  [[nodiscard]] NGIN_METADATA_API AnnotationTypeId AnnotationBase(AnnotationTypeId id) noexcept;
  // Id of ExternalName; built-in types are registered with the registry itself.
  [[nodiscard]] NGIN_METADATA_API AnnotationTypeId ExternalNameType() noexcept;

  class Annotation
  {
  public:
    Annotation() = default;
    Annotation(AnnotationTypeId type, std::string_view typeName, SourceLocation location = {})
        : m_type(type), m_typeName(typeName), m_location(location)
    {
    }

    template <class A>
    [[nodiscard]] static Annotation Of(std::source_location loc = std::source_location::current())
    {
      const auto id = EnsureAnnotationType<A>();
      return Annotation{id, AnnotationTypeName(id), SourceLocation::From(loc)};
    }

    // Add an argument. String keys and values are interned.
    NGIN_METADATA_API Annotation &With(std::string_view key, AttrValue value) &;
    [[nodiscard]] Annotation With(std::string_view key, AttrValue value) &&
    {
      With(key, std::move(value));
      return std::move(*this);
    }

    [[nodiscard]] AnnotationTypeId TypeId() const noexcept { return m_type; }
    [[nodiscard]] std::string_view TypeName() const noexcept { return m_typeName; }
    [[nodiscard]] const SourceLocation &Location() const noexcept { return m_location; }

    [[nodiscard]] NGIN::UIntSize AttributeCount() const noexcept { return m_args.Size(); }
    [[nodiscard]] const AttributeDesc &AttributeAt(NGIN::UIntSize i) const { return m_args[i]; }
    [[nodiscard]] NGIN_METADATA_API std::optional<AttrValue> Find(std::string_view key) const;
    [[nodiscard]] NGIN_METADATA_API std::optional<std::string_view> FindString(std::string_view key) const;

    [[nodiscard]] bool IsA(AnnotationTypeId base) const noexcept { return IsRefinementOf(m_type, base); }
    template <class A>
    [[nodiscard]] bool Is() const
    {
      return IsA(EnsureAnnotationType<A>());
    }

    // Same type and arguments; the source location does not participate.
    friend NGIN_METADATA_API bool operator==(const Annotation &a, const Annotation &b);

  private:
    AnnotationTypeId m_type{0};
    std::string_view m_typeName{};
    NGIN::Containers::Vector<AttributeDesc> m_args{};
    SourceLocation m_location{};
  };

  using Annotations = NGIN::Containers::Vector<Annotation>;

  [[nodiscard]] inline Annotation MakeExternalName(std::string_view name,
                                                   std::source_location loc = std::source_location::current())
  {
    return Annotation::Of<ExternalName>(loc).With("name", AttrValue{std::in_place_type<std::string_view>, name});
  }

} // namespace NGIN::Metadata
