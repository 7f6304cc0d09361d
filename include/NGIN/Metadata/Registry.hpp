// Registry.hpp
// Process-wide registry of described metadata schemas.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/Interface.hpp>
#include <NGIN/Metadata/NameUtils.hpp>
#include <NGIN/Metadata/Strategy.hpp>
#include <NGIN/Metadata/Types.hpp>
#include <NGIN/Metadata/Value.hpp>

#include <concepts>
#include <expected>
#include <string_view>
#include <type_traits>
#include <utility>

namespace NGIN::Metadata
{

  template <class T>
  struct TypeTag
  {
    using type = T;
  };

  template <class T>
  class SchemaBuilder;

  // Optional external customization point for schema types you cannot modify.
  // Specialize in namespace NGIN::Metadata: template<> struct DescribeSchema<MyMeta> { static void Do(SchemaBuilder<MyMeta>&); };
  template <class T>
  struct DescribeSchema;

  // Container shape of a schema member.
  enum class ValueShape : NGIN::UInt8
  {
    Plain = 0,     // X or std::shared_ptr<X>
    Optional,      // std::optional<X>
    List,          // std::vector<X>
    NamedList,     // std::vector<std::pair<std::string, X>>
    NamedMap,      // std::map<std::string, X>
  };

  [[nodiscard]] NGIN_METADATA_API std::string_view ValueShapeName(ValueShape shape) noexcept;

  // Element type category of a schema member (X in the shapes above).
  enum class ElementKind : NGIN::UInt8
  {
    Other = 0,
    Bool,
    String,
    Position,
    Flags,
    Annotation,
    Context,
    Schema,
  };

  [[nodiscard]] NGIN_METADATA_API std::string_view ElementKindName(ElementKind kind) noexcept;

  using StoreFn = std::expected<void, Error> (*)(void *, const MetadataValue &);

  struct SchemaParamDesc
  {
    std::string_view name{};
    SourceLocation location{};
    NGIN::UInt32 group{0};
    TypeRef memberType{};
    ValueShape shape{ValueShape::Plain};
    ElementKind element{ElementKind::Other};
    TypeRef elementType{};
    // X for ContextRef<X> members.
    TypeRef lookupType{};
    SchemaId nestedSchema{0};
    Qualifiers qualifiers{};
    StoreFn Store{nullptr};
  };

  struct SchemaDesc
  {
    SchemaId id{0};
    std::string_view name{};
    std::string_view qualifiedName{};
    SourceLocation location{};
    TagConfig methodTags{};
    TagConfig paramTags{};
    // Type a Verbatim match must carry (method result type or parameter type).
    TypeRef requiredSubject{};
    NGIN::UInt32 groupCount{1};
    NGIN::Containers::Vector<SchemaParamDesc> params{};
  };

  namespace detail
  {
    struct SchemaRegistry
    {
      NGIN::Containers::Vector<SchemaDesc> schemas;
      NGIN::Containers::FlatHashMap<SchemaId, NGIN::UInt32> byId;
    };

    NGIN_METADATA_API SchemaRegistry &GetSchemaRegistry() noexcept;

    template <class T>
    concept HasNginMetadata = requires(SchemaBuilder<T> &b) {
      // ADL friend should be declared as: friend void NginMetadata(TypeTag<T>, SchemaBuilder<T>&)
      { NginMetadata(TypeTag<T>{}, b) } -> std::same_as<void>;
    };

    template <class, class = void>
    struct HasDescribeSchemaImpl : std::false_type
    {
    };
    template <class T>
    struct HasDescribeSchemaImpl<T, std::void_t<decltype(NGIN::Metadata::DescribeSchema<T>::Do(std::declval<SchemaBuilder<T> &>()))>>
        : std::true_type
    {
    };

    template <class T>
    concept DescribedSchema = std::is_class_v<T> && (HasNginMetadata<T> || HasDescribeSchemaImpl<T>::value);

    template <class M>
    struct MemberPtrTraits;
    template <class C, class M>
    struct MemberPtrTraits<M C::*>
    {
      using Class = C;
      using Member = M;
    };

    template <auto MemberPtr>
    using MemberClassT = typename MemberPtrTraits<decltype(MemberPtr)>::Class;

    template <auto MemberPtr>
    using MemberTypeT = typename MemberPtrTraits<decltype(MemberPtr)>::Member;

    // Ensure a schema is present; returns its id. The record is inserted before the
    // description runs so self-referencing schemas terminate.
    template <class T>
    SchemaId EnsureSchemaRegistered()
    {
      using U = std::remove_cvref_t<T>;
      auto &reg = GetSchemaRegistry();
      const auto id = TypeIdOf<U>();
      if (reg.byId.GetPtr(id))
        return id;

      SchemaDesc rec{};
      rec.id = id;
      rec.qualifiedName = InternName(TypeNameOf<U>());
      rec.name = rec.qualifiedName;

      const auto idx = static_cast<NGIN::UInt32>(reg.schemas.Size());
      reg.schemas.PushBack(std::move(rec));
      reg.byId.Insert(id, idx);

      if constexpr (HasNginMetadata<U>)
      {
        SchemaBuilder<U> b{idx};
        NginMetadata(TypeTag<U>{}, b); // ADL
      }
      else if constexpr (HasDescribeSchemaImpl<U>::value)
      {
        SchemaBuilder<U> b{idx};
        NGIN::Metadata::DescribeSchema<U>::Do(b);
      }
      return id;
    }
  } // namespace detail

  // Registered schema by id; nullptr when unknown. The pointer is invalidated by further registrations.
  [[nodiscard]] NGIN_METADATA_API const SchemaDesc *FindSchema(SchemaId id) noexcept;
  [[nodiscard]] NGIN_METADATA_API NGIN::UIntSize SchemaCount() noexcept;

  template <class T>
  [[nodiscard]] SchemaId SchemaIdOf()
  {
    return detail::EnsureSchemaRegistered<T>();
  }

} // namespace NGIN::Metadata
