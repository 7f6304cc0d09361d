// Interface.hpp
// In-memory model of a reflected real interface: methods, parameter groups, annotations.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <NGIN/Metadata/Annotations.hpp>
#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/NameUtils.hpp>
#include <NGIN/Metadata/Types.hpp>

#include <initializer_list>
#include <source_location>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace NGIN::Metadata
{

  struct TypeRef
  {
    std::string_view name{};
    TypeId id{0};

    [[nodiscard]] constexpr bool IsKnown() const noexcept { return id != 0; }

    template <class T>
    [[nodiscard]] static TypeRef Of()
    {
      return TypeRef{detail::InternName(detail::TypeNameOf<T>()), detail::TypeIdOf<T>()};
    }
    [[nodiscard]] static TypeRef Named(std::string_view qualifiedName)
    {
      return TypeRef{detail::InternName(qualifiedName), detail::TypeIdOfName(qualifiedName)};
    }

    friend constexpr bool operator==(const TypeRef &a, const TypeRef &b) noexcept { return a.id == b.id; }
  };

  enum class ParamFlag : NGIN::UInt8
  {
    Contextual = 1u << 0,
    ByReference = 1u << 1,
    Variadic = 1u << 2,
    HasDefault = 1u << 3,
    Synthetic = 1u << 4,
  };

  class ParamFlags
  {
  public:
    constexpr ParamFlags() = default;
    constexpr ParamFlags(ParamFlag f) noexcept : m_bits(static_cast<NGIN::UInt8>(f)) {}
    explicit constexpr ParamFlags(NGIN::UInt8 bits) noexcept : m_bits(bits) {}

    [[nodiscard]] constexpr bool Has(ParamFlag f) const noexcept { return (m_bits & static_cast<NGIN::UInt8>(f)) != 0; }
    [[nodiscard]] constexpr NGIN::UInt8 Bits() const noexcept { return m_bits; }
    [[nodiscard]] constexpr bool IsContextual() const noexcept { return Has(ParamFlag::Contextual); }
    [[nodiscard]] constexpr bool IsByReference() const noexcept { return Has(ParamFlag::ByReference); }
    [[nodiscard]] constexpr bool IsVariadic() const noexcept { return Has(ParamFlag::Variadic); }
    [[nodiscard]] constexpr bool HasDefaultValue() const noexcept { return Has(ParamFlag::HasDefault); }
    [[nodiscard]] constexpr bool IsSynthetic() const noexcept { return Has(ParamFlag::Synthetic); }

    friend constexpr ParamFlags operator|(ParamFlags a, ParamFlags b) noexcept
    {
      return ParamFlags{static_cast<NGIN::UInt8>(a.m_bits | b.m_bits)};
    }
    friend constexpr bool operator==(ParamFlags a, ParamFlags b) noexcept { return a.m_bits == b.m_bits; }

  private:
    NGIN::UInt8 m_bits{0};
  };

  constexpr ParamFlags operator|(ParamFlag a, ParamFlag b) noexcept { return ParamFlags{a} | ParamFlags{b}; }

  struct ParamDecl
  {
    std::string_view name{};
    TypeRef type{};
    // Index across all groups, index of the group, index within the group.
    NGIN::UInt32 index{0};
    NGIN::UInt32 groupIndex{0};
    NGIN::UInt32 indexInGroup{0};
    ParamFlags flags{};
    Annotations annotations{};
    SourceLocation location{};
  };

  // Declaration a real method overrides or implements; only its annotations are relevant.
  struct OverriddenDecl
  {
    std::string_view owner{};
    Annotations annotations{};
    // Annotations of the overridden method's parameters, by global parameter index.
    NGIN::Containers::Vector<Annotations> paramAnnotations{};
  };

  struct MethodDecl
  {
    std::string_view name{};
    TypeRef resultType{};
    NGIN::UInt32 index{0};
    NGIN::Containers::Vector<NGIN::Containers::Vector<ParamDecl>> groups{};
    Annotations annotations{};
    NGIN::Containers::Vector<OverriddenDecl> overridden{};
    SourceLocation location{};

    [[nodiscard]] const NGIN::Containers::Vector<NGIN::Containers::Vector<ParamDecl>> &ParameterGroups() const noexcept { return groups; }
    [[nodiscard]] NGIN::UIntSize ParameterCount() const noexcept
    {
      NGIN::UIntSize n = 0;
      for (NGIN::UIntSize g = 0; g < groups.Size(); ++g)
        n += groups[g].Size();
      return n;
    }
    // Parameter by global index; nullptr when out of range.
    [[nodiscard]] NGIN_METADATA_API const ParamDecl *ParamAt(NGIN::UIntSize index) const noexcept;
  };

  struct SupertypeDecl
  {
    std::string_view name{};
    Annotations annotations{};
  };

  struct InterfaceDecl
  {
    std::string_view name{};
    TypeRef type{};
    NGIN::Containers::Vector<MethodDecl> methods{};
    Annotations annotations{};
    NGIN::Containers::Vector<SupertypeDecl> supertypes{};
    SourceLocation location{};

    [[nodiscard]] const NGIN::Containers::Vector<MethodDecl> &Methods() const noexcept { return methods; }
  };

  // Annotations visible on a declaration, own level first, then each inherited level in order:
  // supertypes for interfaces, overridden declarations for methods, index-corresponding
  // parameters of overridden methods for parameters.
  class AnnotationLevels
  {
  public:
    [[nodiscard]] NGIN::UIntSize LevelCount() const noexcept { return m_levels.Size(); }
    [[nodiscard]] const Annotations &Level(NGIN::UIntSize i) const { return *m_levels[i]; }

    void Push(const Annotations &level) { m_levels.PushBack(&level); }

    // First annotation refining `type`, searching the own level before inherited ones.
    [[nodiscard]] NGIN_METADATA_API const Annotation *FindFirst(AnnotationTypeId type) const noexcept;
    [[nodiscard]] NGIN_METADATA_API bool Contains(AnnotationTypeId type) const noexcept;

  private:
    NGIN::Containers::Vector<const Annotations *> m_levels{};
  };

  [[nodiscard]] NGIN_METADATA_API AnnotationLevels AnnotationsOf(const InterfaceDecl &iface);
  [[nodiscard]] NGIN_METADATA_API AnnotationLevels AnnotationsOf(const MethodDecl &method);
  [[nodiscard]] NGIN_METADATA_API AnnotationLevels AnnotationsOf(const MethodDecl &method, const ParamDecl &param);

  namespace detail
  {
    template <typename>
    struct MethodTraits;

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...)>
    {
      using Class = C;
      using Ret = R;
      using Args = std::tuple<A...>;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
    };

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) const> : MethodTraits<R (C::*)(A...)>
    {
    };

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) noexcept> : MethodTraits<R (C::*)(A...)>
    {
    };

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) const noexcept> : MethodTraits<R (C::*)(A...)>
    {
    };
  } // namespace detail

  class InterfaceBuilder;

  // Edits one method of an InterfaceBuilder; parameters go into the current group.
  class NGIN_METADATA_API MethodBuilder
  {
  public:
    MethodBuilder(InterfaceBuilder &owner, NGIN::UInt32 methodIndex) : m_owner(&owner), m_index(methodIndex) {}

    MethodBuilder &Annotate(Annotation annotation);
    MethodBuilder &Param(std::string_view name, TypeRef type, ParamFlags flags = {},
                         std::source_location loc = std::source_location::current());
    // Annotate the most recently added parameter.
    MethodBuilder &ParamAnnotate(Annotation annotation);
    // Start a new parameter group.
    MethodBuilder &NextGroup();
    // Record an overridden/implemented declaration; following Overridden* calls target it.
    MethodBuilder &Overrides(std::string_view owner);
    MethodBuilder &OverriddenAnnotate(Annotation annotation);
    MethodBuilder &OverriddenParamAnnotate(NGIN::UInt32 paramIndex, Annotation annotation);

    [[nodiscard]] MethodDecl &Decl();

  private:
    InterfaceBuilder *m_owner{nullptr};
    NGIN::UInt32 m_index{0};
  };

  class NGIN_METADATA_API InterfaceBuilder
  {
  public:
    explicit InterfaceBuilder(std::string_view name, std::source_location loc = std::source_location::current());

    template <class T>
    [[nodiscard]] static InterfaceBuilder For(std::source_location loc = std::source_location::current())
    {
      InterfaceBuilder b{detail::TypeNameOf<T>(), loc};
      b.m_decl.type = TypeRef::Of<T>();
      return b;
    }

    InterfaceBuilder &Annotate(Annotation annotation);
    InterfaceBuilder &Supertype(std::string_view name, std::initializer_list<Annotation> annotations = {});

    MethodBuilder Method(std::string_view name, TypeRef resultType,
                         std::source_location loc = std::source_location::current());

    // Register a member function; result and parameter types come from its signature,
    // reference parameters are flagged ByReference. Missing names default to "argN".
    template <auto MemFn>
    MethodBuilder Method(std::string_view name, std::initializer_list<std::string_view> paramNames = {},
                         std::source_location loc = std::source_location::current())
    {
      using Traits = detail::MethodTraits<decltype(MemFn)>;
      TypeRef result{};
      if constexpr (!std::is_void_v<typename Traits::Ret>)
        result = TypeRef::Of<typename Traits::Ret>();
      auto mb = Method(name, result, loc);
      AddSignatureParams<typename Traits::Args>(mb, paramNames, loc, std::make_index_sequence<Traits::Arity>{});
      return mb;
    }

    [[nodiscard]] const InterfaceDecl &Peek() const noexcept { return m_decl; }
    [[nodiscard]] InterfaceDecl Build() const { return m_decl; }

  private:
    friend class MethodBuilder;

    template <class Tuple, std::size_t... I>
    static void AddSignatureParams(MethodBuilder &mb, std::initializer_list<std::string_view> names,
                                   std::source_location loc, std::index_sequence<I...>)
    {
      (AddSignatureParam<std::tuple_element_t<I, Tuple>>(mb, I, names, loc), ...);
    }

    template <class P>
    static void AddSignatureParam(MethodBuilder &mb, std::size_t i, std::initializer_list<std::string_view> names,
                                  std::source_location loc)
    {
      ParamFlags flags{};
      if constexpr (std::is_reference_v<P>)
        flags = ParamFlag::ByReference;
      std::string_view name{};
      if (i < names.size())
        name = *(names.begin() + i);
      mb.Param(name.empty() ? GeneratedParamName(i) : name, TypeRef::Of<P>(), flags, loc);
    }

    static std::string_view GeneratedParamName(std::size_t i);

    InterfaceDecl m_decl{};
  };

} // namespace NGIN::Metadata
