#include <NGIN/Metadata/Registry.hpp>
#include <NGIN/Metadata/Annotations.hpp>
#include <NGIN/Metadata/NameUtils.hpp>

#include <NGIN/Utilities/StringInterner.hpp>

namespace NGIN::Metadata::detail
{

  namespace
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    struct AnnotationTypeRecord
    {
      std::string_view name;
      AnnotationTypeId id{0};
      AnnotationTypeId base{0};
    };

    struct AnnotationTypeRegistry
    {
      NGIN::Containers::Vector<AnnotationTypeRecord> types;
      NGIN::Containers::FlatHashMap<AnnotationTypeId, NGIN::UInt32> byId;
    };

    StringInterner &GetNames() noexcept
    {
      static StringInterner names{};
      return names;
    }

    AnnotationTypeRegistry &GetAnnotationTypes() noexcept
    {
      static AnnotationTypeRegistry registry = [] {
        AnnotationTypeRegistry r{};
        AnnotationTypeRecord rec{};
        rec.name = InternName(TypeNameOf<ExternalName>());
        rec.id = TypeIdOf<ExternalName>();
        r.types.PushBack(rec);
        r.byId.Insert(rec.id, 0);
        return r;
      }();
      return registry;
    }

    const AnnotationTypeRecord *FindAnnotationType(AnnotationTypeId id) noexcept
    {
      auto &reg = GetAnnotationTypes();
      if (auto *p = reg.byId.GetPtr(id))
        return &reg.types[*p];
      return nullptr;
    }
  } // namespace

  std::string_view InternName(std::string_view s) noexcept
  {
    return GetNames().Intern(s);
  }

  SchemaRegistry &GetSchemaRegistry() noexcept
  {
    static SchemaRegistry registry{};
    return registry;
  }

  AnnotationTypeId RegisterAnnotationType(std::string_view name, AnnotationTypeId id, AnnotationTypeId base)
  {
    auto &reg = GetAnnotationTypes();
    if (reg.byId.GetPtr(id))
      return id;
    AnnotationTypeRecord rec{};
    rec.name = InternName(name);
    rec.id = id;
    rec.base = base;
    const auto idx = static_cast<NGIN::UInt32>(reg.types.Size());
    reg.types.PushBack(rec);
    reg.byId.Insert(id, idx);
    return id;
  }

} // namespace NGIN::Metadata::detail

namespace NGIN::Metadata
{

  bool IsRefinementOf(AnnotationTypeId derived, AnnotationTypeId base) noexcept
  {
    if (derived == 0 || base == 0)
      return false;
    // Bounded by the number of registered types; guards against malformed chains.
    auto remaining = detail::GetAnnotationTypes().types.Size() + 1;
    for (auto cur = derived; cur != 0 && remaining > 0; --remaining)
    {
      if (cur == base)
        return true;
      const auto *rec = detail::FindAnnotationType(cur);
      if (!rec)
        return false;
      cur = rec->base;
    }
    return false;
  }

  bool IsAnnotationType(AnnotationTypeId id) noexcept
  {
    return detail::FindAnnotationType(id) != nullptr;
  }

  std::string_view AnnotationTypeName(AnnotationTypeId id) noexcept
  {
    const auto *rec = detail::FindAnnotationType(id);
    return rec ? rec->name : std::string_view{};
  }

  AnnotationTypeId AnnotationBase(AnnotationTypeId id) noexcept
  {
    const auto *rec = detail::FindAnnotationType(id);
    return rec ? rec->base : 0;
  }

  AnnotationTypeId ExternalNameType() noexcept
  {
    return detail::GetAnnotationTypes().types[0].id;
  }

  const SchemaDesc *FindSchema(SchemaId id) noexcept
  {
    auto &reg = detail::GetSchemaRegistry();
    if (auto *p = reg.byId.GetPtr(id))
      return &reg.schemas[*p];
    return nullptr;
  }

  NGIN::UIntSize SchemaCount() noexcept
  {
    return detail::GetSchemaRegistry().schemas.Size();
  }

  std::string_view ValueShapeName(ValueShape shape) noexcept
  {
    switch (shape)
    {
    case ValueShape::Plain:
      return "plain";
    case ValueShape::Optional:
      return "optional";
    case ValueShape::List:
      return "list";
    case ValueShape::NamedList:
      return "named list";
    case ValueShape::NamedMap:
      return "named map";
    }
    return "unknown";
  }

  std::string_view ElementKindName(ElementKind kind) noexcept
  {
    switch (kind)
    {
    case ElementKind::Other:
      return "unsupported";
    case ElementKind::Bool:
      return "bool";
    case ElementKind::String:
      return "string";
    case ElementKind::Position:
      return "ParamPosition";
    case ElementKind::Flags:
      return "ParamFlags";
    case ElementKind::Annotation:
      return "Annotation";
    case ElementKind::Context:
      return "ContextRef";
    case ElementKind::Schema:
      return "schema";
    }
    return "unknown";
  }

} // namespace NGIN::Metadata
