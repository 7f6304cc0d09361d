#include <NGIN/Metadata/Value.hpp>

namespace NGIN::Metadata
{

  std::string_view ValueKindName(ValueKind kind) noexcept
  {
    switch (kind)
    {
    case ValueKind::Absent:
      return "absent";
    case ValueKind::Bool:
      return "bool";
    case ValueKind::String:
      return "string";
    case ValueKind::Position:
      return "position";
    case ValueKind::Flags:
      return "flags";
    case ValueKind::Annotation:
      return "annotation";
    case ValueKind::Context:
      return "context";
    case ValueKind::Record:
      return "record";
    case ValueKind::List:
      return "list";
    case ValueKind::Map:
      return "map";
    }
    return "unknown";
  }

  MetadataValue MetadataValue::Record(RecordValue v)
  {
    return MetadataValue{Storage{std::in_place_index<7>, std::make_shared<const RecordValue>(std::move(v))}};
  }

  MetadataValue MetadataValue::List(ListValue v)
  {
    return MetadataValue{Storage{std::in_place_index<8>, std::make_shared<const ListValue>(std::move(v))}};
  }

  MetadataValue MetadataValue::Map(MapValue v)
  {
    return MetadataValue{Storage{std::in_place_index<9>, std::make_shared<const MapValue>(std::move(v))}};
  }

  const MetadataValue *MetadataValue::Field(std::string_view name) const noexcept
  {
    if (Kind() != ValueKind::Record)
      return nullptr;
    return AsRecord().Find(name);
  }

  const MetadataValue *RecordValue::Find(std::string_view name) const noexcept
  {
    for (NGIN::UIntSize i = 0; i < fields.Size(); ++i)
      if (fields[i].name == name)
        return &fields[i].value;
    return nullptr;
  }

  const MetadataValue *MapValue::Find(std::string_view key) const noexcept
  {
    for (NGIN::UIntSize i = 0; i < entries.Size(); ++i)
      if (entries[i].key == key)
        return &entries[i].value;
    return nullptr;
  }

  bool operator==(const MetadataValue &a, const MetadataValue &b)
  {
    if (a.Kind() != b.Kind())
      return false;
    switch (a.Kind())
    {
    case ValueKind::Absent:
      return true;
    case ValueKind::Bool:
      return a.AsBool() == b.AsBool();
    case ValueKind::String:
      return a.AsString() == b.AsString();
    case ValueKind::Position:
      return a.AsPosition() == b.AsPosition();
    case ValueKind::Flags:
      return a.AsFlags() == b.AsFlags();
    case ValueKind::Annotation:
      return a.AsAnnotation() == b.AsAnnotation();
    case ValueKind::Context:
      return a.AsContext() == b.AsContext();
    case ValueKind::Record:
    {
      const auto &ra = a.AsRecord();
      const auto &rb = b.AsRecord();
      if (ra.schema != rb.schema || ra.fields.Size() != rb.fields.Size())
        return false;
      for (NGIN::UIntSize i = 0; i < ra.fields.Size(); ++i)
        if (ra.fields[i].name != rb.fields[i].name || !(ra.fields[i].value == rb.fields[i].value))
          return false;
      return true;
    }
    case ValueKind::List:
    {
      const auto &la = a.AsList().items;
      const auto &lb = b.AsList().items;
      if (la.Size() != lb.Size())
        return false;
      for (NGIN::UIntSize i = 0; i < la.Size(); ++i)
        if (!(la[i] == lb[i]))
          return false;
      return true;
    }
    case ValueKind::Map:
    {
      const auto &ma = a.AsMap().entries;
      const auto &mb = b.AsMap().entries;
      if (ma.Size() != mb.Size())
        return false;
      for (NGIN::UIntSize i = 0; i < ma.Size(); ++i)
        if (ma[i].key != mb[i].key || !(ma[i].value == mb[i].value))
          return false;
      return true;
    }
    }
    return false;
  }

} // namespace NGIN::Metadata
