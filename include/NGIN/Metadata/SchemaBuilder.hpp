// SchemaBuilder.hpp
// Fluent description of metadata schemas: parameters, strategies and qualifiers.
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Metadata/Annotations.hpp>
#include <NGIN/Metadata/Convert.hpp>
#include <NGIN/Metadata/Interface.hpp>
#include <NGIN/Metadata/NameUtils.hpp>
#include <NGIN/Metadata/Registry.hpp>
#include <NGIN/Metadata/Strategy.hpp>
#include <NGIN/Metadata/Value.hpp>

#include <map>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace NGIN::Metadata
{

  namespace detail
  {
    template <class M>
    struct MemberShape
    {
      static constexpr ValueShape shape = ValueShape::Plain;
      using Element = M;
    };
    template <class X>
    struct MemberShape<std::optional<X>>
    {
      static constexpr ValueShape shape = ValueShape::Optional;
      using Element = X;
    };
    template <class X>
    struct MemberShape<std::shared_ptr<X>>
    {
      static constexpr ValueShape shape = ValueShape::Plain;
      using Element = std::remove_const_t<X>;
    };
    template <class X>
    struct MemberShape<std::vector<X>>
    {
      static constexpr ValueShape shape = ValueShape::List;
      using Element = X;
    };
    template <class X>
    struct MemberShape<std::vector<std::pair<std::string, X>>>
    {
      static constexpr ValueShape shape = ValueShape::NamedList;
      using Element = X;
    };
    template <class X>
    struct MemberShape<std::map<std::string, X>>
    {
      static constexpr ValueShape shape = ValueShape::NamedMap;
      using Element = X;
    };

    template <class X>
    struct ContextTarget
    {
      static constexpr bool value = false;
      using Type = void;
    };
    template <class X>
    struct ContextTarget<ContextRef<X>>
    {
      static constexpr bool value = true;
      using Type = X;
    };

    template <class E>
    constexpr ElementKind ElementKindOf() noexcept
    {
      if constexpr (std::is_same_v<E, bool>)
        return ElementKind::Bool;
      else if constexpr (std::is_same_v<E, std::string>)
        return ElementKind::String;
      else if constexpr (std::is_same_v<E, ParamPosition>)
        return ElementKind::Position;
      else if constexpr (std::is_same_v<E, ParamFlags>)
        return ElementKind::Flags;
      else if constexpr (std::is_same_v<E, NGIN::Metadata::Annotation>)
        return ElementKind::Annotation;
      else if constexpr (ContextTarget<E>::value)
        return ElementKind::Context;
      else if constexpr (DescribedSchema<E>)
        return ElementKind::Schema;
      else
        return ElementKind::Other;
    }

    template <class A>
    AnnotationTypeId AnnotationTypeOrNone()
    {
      if constexpr (std::is_void_v<A>)
        return 0;
      else
        return EnsureAnnotationType<A>();
    }

    template <class B, class D>
    TagConfig MakeTagConfig()
    {
      return TagConfig{EnsureAnnotationType<B>(), AnnotationTypeOrNone<D>()};
    }
  } // namespace detail

  // Qualifies one schema parameter. Valid until the next parameter of any schema is registered.
  class ParamBuilder
  {
  public:
    ParamBuilder(NGIN::UInt32 schemaIndex, NGIN::UInt32 paramIndex) : m_schema(schemaIndex), m_param(paramIndex) {}

    // Nested schema resolved against the same declaration.
    ParamBuilder &Embedded() { return Mark(Marker::Embedded); }
    // Nested schema matched against the methods of the interface.
    ParamBuilder &Methods() { return Mark(Marker::Methods); }
    // Nested schema matched against the parameters of the current method.
    ParamBuilder &Parameters() { return Mark(Marker::Parameters); }

    ParamBuilder &Lookup() { return Mark(Marker::Lookup); }
    // Absence of the instance rejects the match instead of deferring the failure.
    ParamBuilder &Checked()
    {
      Q().strict = true;
      return *this;
    }
    // Key the lookup by the declaration's type as well as the requested type.
    ParamBuilder &ForSubjectType()
    {
      Q().bySubjectType = true;
      return *this;
    }

    template <class A>
    ParamBuilder &Annotation()
    {
      Q().annotationType = EnsureAnnotationType<A>();
      return Mark(Marker::Annotation);
    }
    ParamBuilder &Name(bool useExternalName = false)
    {
      Q().useExternalName = useExternalName;
      return Mark(Marker::Name);
    }
    ParamBuilder &Position() { return Mark(Marker::Position); }
    ParamBuilder &Flags() { return Mark(Marker::Flags); }
    template <class A>
    ParamBuilder &Has()
    {
      Q().annotationType = EnsureAnnotationType<A>();
      return Mark(Marker::Presence);
    }

    ParamBuilder &ExactlyOne()
    {
      Q().cardinality = Cardinality{NGIN::Metadata::ExactlyOne{}};
      return *this;
    }
    ParamBuilder &ZeroOrOne()
    {
      Q().cardinality = Cardinality{NGIN::Metadata::ZeroOrOne{}};
      return *this;
    }
    ParamBuilder &Many(Naming naming = Naming::Positional)
    {
      Q().cardinality = Cardinality{NGIN::Metadata::Many{naming}};
      return *this;
    }

    template <class T>
    ParamBuilder &Tagged()
    {
      Q().tag = EnsureAnnotationType<T>();
      return *this;
    }
    // Match members without consuming them.
    ParamBuilder &Auxiliary()
    {
      Q().auxiliary = true;
      return *this;
    }
    ParamBuilder &Verbatim()
    {
      Q().encoding = Encoding::Verbatim;
      return *this;
    }
    ParamBuilder &Encoded()
    {
      Q().encoding = Encoding::Encoded;
      return *this;
    }
    // Parameter tag configuration for the methods this parameter matches.
    template <class B, class D = void>
    ParamBuilder &ParamTags()
    {
      Q().paramTags = detail::MakeTagConfig<B, D>();
      return *this;
    }
    // Only accept members whose externally-facing name equals `name`.
    ParamBuilder &MatchName(std::string_view name)
    {
      Q().matchName = detail::InternName(name);
      return *this;
    }

  private:
    [[nodiscard]] SchemaParamDesc &Desc() const
    {
      return detail::GetSchemaRegistry().schemas[m_schema].params[m_param];
    }
    [[nodiscard]] Qualifiers &Q() const { return Desc().qualifiers; }

    ParamBuilder &Mark(Marker m)
    {
      Q().markers.PushBack(m);
      return *this;
    }

    NGIN::UInt32 m_schema{0};
    NGIN::UInt32 m_param{0};
  };

  template <class T>
  class SchemaBuilder
  {
  public:
    explicit SchemaBuilder(NGIN::UInt32 index) : m_index(index) {}

    // Register a data member as a schema parameter. The name defaults to the member identifier.
    template <auto MemberPtr>
    ParamBuilder Param(std::string_view name = detail::ParamNameOf<MemberPtr>(),
                       std::source_location loc = std::source_location::current())
    {
      static_assert(std::is_same_v<detail::MemberClassT<MemberPtr>, T>, "Param requires a member of the described schema");
      using M = detail::MemberTypeT<MemberPtr>;
      using Shape = detail::MemberShape<M>;
      using E = typename Shape::Element;

      SchemaParamDesc p{};
      p.name = detail::InternName(name);
      p.location = SourceLocation::From(loc);
      p.group = m_group;
      p.memberType = TypeRef::Of<M>();
      p.shape = Shape::shape;
      p.element = detail::ElementKindOf<E>();
      p.elementType = TypeRef::Of<E>();
      if constexpr (detail::ContextTarget<E>::value)
        p.lookupType = TypeRef::Of<typename detail::ContextTarget<E>::Type>();
      if constexpr (detail::DescribedSchema<E>)
        p.nestedSchema = detail::EnsureSchemaRegistered<E>();
      p.Store = &detail::ParamStore<MemberPtr>;

      // Registering the nested schema may have grown the registry; fetch the record afterwards.
      auto &desc = Desc();
      if (!desc.location.IsKnown())
        desc.location = p.location;
      const auto paramIndex = static_cast<NGIN::UInt32>(desc.params.Size());
      desc.params.PushBack(std::move(p));
      return ParamBuilder{m_index, paramIndex};
    }

    SchemaBuilder &SetName(std::string_view name)
    {
      Desc().name = detail::InternName(name);
      return *this;
    }
    // Following parameters go into a new parameter group.
    SchemaBuilder &NextGroup()
    {
      ++m_group;
      Desc().groupCount = m_group + 1;
      return *this;
    }
    template <class B, class D = void>
    SchemaBuilder &MethodTags()
    {
      Desc().methodTags = detail::MakeTagConfig<B, D>();
      return *this;
    }
    template <class B, class D = void>
    SchemaBuilder &ParamTags()
    {
      Desc().paramTags = detail::MakeTagConfig<B, D>();
      return *this;
    }
    // Verbatim matches must have this result (method schema) or parameter type (parameter schema).
    template <class S>
    SchemaBuilder &RequireSubjectType()
    {
      Desc().requiredSubject = TypeRef::Of<S>();
      return *this;
    }

  private:
    [[nodiscard]] SchemaDesc &Desc() const { return detail::GetSchemaRegistry().schemas[m_index]; }

    NGIN::UInt32 m_index{0};
    NGIN::UInt32 m_group{0};
  };

} // namespace NGIN::Metadata
