// Value.hpp
// Immutable value tree produced by a derivation.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <NGIN/Metadata/Annotations.hpp>
#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/Interface.hpp>
#include <NGIN/Metadata/Types.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace NGIN::Metadata
{

  // Position of a matched parameter: global index, group index, index within the group,
  // index among the parameters matched by the same schema parameter.
  struct ParamPosition
  {
    NGIN::UInt32 index{0};
    NGIN::UInt32 indexOfGroup{0};
    NGIN::UInt32 indexInGroup{0};
    NGIN::UInt32 indexInRaw{0};

    friend constexpr bool operator==(const ParamPosition &, const ParamPosition &) noexcept = default;
  };

  // Key of a contextual instance. `subject` is 0 for lookups that only depend on the requested type.
  struct ContextKey
  {
    TypeId requested{0};
    TypeId subject{0};

    friend constexpr bool operator==(const ContextKey &, const ContextKey &) noexcept = default;
  };

  // Schema parameter and real declaration a contextual reference was requested for.
  struct ContextOrigin
  {
    std::string schemaPath{};
    SourceLocation schemaLocation{};
    DeclRef declaration{};
  };

  // Reference to a contextual instance; unresolved until the instance is attached.
  class ContextHandle
  {
  public:
    ContextHandle() = default;
    ContextHandle(ContextKey key, std::string_view typeName, std::shared_ptr<const Any> instance = {})
        : m_key(key), m_typeName(typeName), m_instance(std::move(instance))
    {
    }

    [[nodiscard]] const ContextKey &Key() const noexcept { return m_key; }
    [[nodiscard]] std::string_view TypeName() const noexcept { return m_typeName; }
    [[nodiscard]] bool IsResolved() const noexcept { return static_cast<bool>(m_instance); }
    [[nodiscard]] const std::shared_ptr<const Any> &Instance() const noexcept { return m_instance; }

    // Provenance is not part of the handle's identity.
    ContextHandle &SetOrigin(ContextOrigin origin)
    {
      m_origin = std::make_shared<const ContextOrigin>(std::move(origin));
      return *this;
    }
    // nullptr for handles built outside a derivation.
    [[nodiscard]] const ContextOrigin *Origin() const noexcept { return m_origin.get(); }

    // Same reference and provenance with `instance` attached.
    [[nodiscard]] ContextHandle Resolved(std::shared_ptr<const Any> instance) const
    {
      ContextHandle h{*this};
      h.m_instance = std::move(instance);
      return h;
    }

    // Resolved handles compare by instance identity, deferred ones by key.
    friend bool operator==(const ContextHandle &a, const ContextHandle &b) noexcept
    {
      return a.m_key == b.m_key && a.m_instance == b.m_instance;
    }

  private:
    ContextKey m_key{};
    std::string_view m_typeName{};
    std::shared_ptr<const Any> m_instance{};
    std::shared_ptr<const ContextOrigin> m_origin{};
  };

  // Typed view of a ContextHandle stored into a schema member.
  template <class T>
  class ContextRef
  {
  public:
    using ValueType = T;

    ContextRef() = default;
    explicit ContextRef(ContextHandle handle) : m_handle(std::move(handle)) {}

    [[nodiscard]] bool IsResolved() const noexcept { return m_handle.IsResolved(); }
    [[nodiscard]] const ContextHandle &Handle() const noexcept { return m_handle; }
    // Precondition: IsResolved().
    [[nodiscard]] T Value() const { return m_handle.Instance()->template Cast<T>(); }

  private:
    ContextHandle m_handle{};
  };

  enum class ValueKind : NGIN::UInt8
  {
    Absent = 0,
    Bool,
    String,
    Position,
    Flags,
    Annotation,
    Context,
    Record,
    List,
    Map,
  };

  [[nodiscard]] NGIN_METADATA_API std::string_view ValueKindName(ValueKind kind) noexcept;

  struct RecordValue;
  struct ListValue;
  struct MapValue;

  class NGIN_METADATA_API MetadataValue
  {
  public:
    MetadataValue() = default;

    [[nodiscard]] static MetadataValue Absent() { return MetadataValue{}; }
    [[nodiscard]] static MetadataValue Bool(bool v) { return MetadataValue{Storage{std::in_place_index<1>, v}}; }
    [[nodiscard]] static MetadataValue String(std::string v) { return MetadataValue{Storage{std::in_place_index<2>, std::move(v)}}; }
    [[nodiscard]] static MetadataValue Position(ParamPosition v) { return MetadataValue{Storage{std::in_place_index<3>, v}}; }
    [[nodiscard]] static MetadataValue Flags(ParamFlags v) { return MetadataValue{Storage{std::in_place_index<4>, v}}; }
    [[nodiscard]] static MetadataValue Annotation(NGIN::Metadata::Annotation v) { return MetadataValue{Storage{std::in_place_index<5>, std::move(v)}}; }
    [[nodiscard]] static MetadataValue Context(ContextHandle v) { return MetadataValue{Storage{std::in_place_index<6>, std::move(v)}}; }
    [[nodiscard]] static MetadataValue Record(RecordValue v);
    [[nodiscard]] static MetadataValue List(ListValue v);
    [[nodiscard]] static MetadataValue Map(MapValue v);

    [[nodiscard]] ValueKind Kind() const noexcept { return static_cast<ValueKind>(m_storage.index()); }
    [[nodiscard]] bool IsAbsent() const noexcept { return Kind() == ValueKind::Absent; }

    // Accessors; precondition: Kind() matches.
    [[nodiscard]] bool AsBool() const { return std::get<1>(m_storage); }
    [[nodiscard]] const std::string &AsString() const { return std::get<2>(m_storage); }
    [[nodiscard]] const ParamPosition &AsPosition() const { return std::get<3>(m_storage); }
    [[nodiscard]] ParamFlags AsFlags() const { return std::get<4>(m_storage); }
    [[nodiscard]] const NGIN::Metadata::Annotation &AsAnnotation() const { return std::get<5>(m_storage); }
    [[nodiscard]] const ContextHandle &AsContext() const { return std::get<6>(m_storage); }
    [[nodiscard]] const RecordValue &AsRecord() const { return *std::get<7>(m_storage); }
    [[nodiscard]] const ListValue &AsList() const { return *std::get<8>(m_storage); }
    [[nodiscard]] const MapValue &AsMap() const { return *std::get<9>(m_storage); }

    // Field of a record by name; nullptr when not a record or not present.
    [[nodiscard]] const MetadataValue *Field(std::string_view name) const noexcept;

    // Deep structural equality.
    friend NGIN_METADATA_API bool operator==(const MetadataValue &a, const MetadataValue &b);

  private:
    using Storage = std::variant<std::monostate, bool, std::string, ParamPosition, ParamFlags,
                                 NGIN::Metadata::Annotation, ContextHandle,
                                 std::shared_ptr<const RecordValue>, std::shared_ptr<const ListValue>,
                                 std::shared_ptr<const MapValue>>;

    explicit MetadataValue(Storage s) : m_storage(std::move(s)) {}

    Storage m_storage{};
  };

  struct RecordField
  {
    std::string_view name{};
    MetadataValue value{};
  };

  struct RecordValue
  {
    SchemaId schema{0};
    std::string_view schemaName{};
    NGIN::Containers::Vector<RecordField> fields{};

    [[nodiscard]] NGIN_METADATA_API const MetadataValue *Find(std::string_view name) const noexcept;
  };

  struct ListValue
  {
    NGIN::Containers::Vector<MetadataValue> items{};
  };

  struct MapEntry
  {
    std::string key{};
    MetadataValue value{};
  };

  // Name-keyed collection; entries keep insertion order and keys are unique.
  struct MapValue
  {
    NGIN::Containers::Vector<MapEntry> entries{};

    [[nodiscard]] NGIN_METADATA_API const MetadataValue *Find(std::string_view key) const noexcept;
  };

} // namespace NGIN::Metadata
