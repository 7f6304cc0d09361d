// Convert.hpp
// MetadataValue -> C++ member conversion and typed materialization of schema records.
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Metadata/Annotations.hpp>
#include <NGIN/Metadata/Interface.hpp>
#include <NGIN/Metadata/Registry.hpp>
#include <NGIN/Metadata/Types.hpp>
#include <NGIN/Metadata/Value.hpp>

#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace NGIN::Metadata
{

  template <class T>
  Expected<T> Materialize(const MetadataValue &value);

  namespace detail
  {
    [[nodiscard]] inline Error KindMismatch(ValueKind expected, ValueKind actual)
    {
      std::string msg{"expected "};
      msg += ValueKindName(expected);
      msg += " value, got ";
      msg += ValueKindName(actual);
      return Error{ErrorCode::InvalidArgument, std::move(msg)};
    }
  } // namespace detail

  // Conversion of one value into a member of type M. Unsupported member types still register;
  // plan compilation rejects them, and storing into one is an error.
  template <class M>
  struct FromValue
  {
    static Expected<M> Convert(const MetadataValue &)
    {
      std::string msg{"unsupported member type "};
      msg += detail::TypeNameOf<M>();
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::move(msg)});
    }
  };

  template <>
  struct FromValue<bool>
  {
    static Expected<bool> Convert(const MetadataValue &v)
    {
      if (v.Kind() != ValueKind::Bool)
        return std::unexpected(detail::KindMismatch(ValueKind::Bool, v.Kind()));
      return v.AsBool();
    }
  };

  template <>
  struct FromValue<std::string>
  {
    static Expected<std::string> Convert(const MetadataValue &v)
    {
      if (v.Kind() != ValueKind::String)
        return std::unexpected(detail::KindMismatch(ValueKind::String, v.Kind()));
      return v.AsString();
    }
  };

  template <>
  struct FromValue<ParamPosition>
  {
    static Expected<ParamPosition> Convert(const MetadataValue &v)
    {
      if (v.Kind() != ValueKind::Position)
        return std::unexpected(detail::KindMismatch(ValueKind::Position, v.Kind()));
      return v.AsPosition();
    }
  };

  template <>
  struct FromValue<ParamFlags>
  {
    static Expected<ParamFlags> Convert(const MetadataValue &v)
    {
      if (v.Kind() != ValueKind::Flags)
        return std::unexpected(detail::KindMismatch(ValueKind::Flags, v.Kind()));
      return v.AsFlags();
    }
  };

  template <>
  struct FromValue<Annotation>
  {
    static Expected<Annotation> Convert(const MetadataValue &v)
    {
      if (v.Kind() != ValueKind::Annotation)
        return std::unexpected(detail::KindMismatch(ValueKind::Annotation, v.Kind()));
      return v.AsAnnotation();
    }
  };

  template <class X>
  struct FromValue<ContextRef<X>>
  {
    static Expected<ContextRef<X>> Convert(const MetadataValue &v)
    {
      if (v.Kind() != ValueKind::Context)
        return std::unexpected(detail::KindMismatch(ValueKind::Context, v.Kind()));
      const auto &h = v.AsContext();
      if (h.IsResolved() && h.Instance()->GetTypeId() != detail::TypeIdOf<X>())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "contextual instance has the wrong type"});
      return ContextRef<X>{h};
    }
  };

  template <class X>
  struct FromValue<std::optional<X>>
  {
    static Expected<std::optional<X>> Convert(const MetadataValue &v)
    {
      if (v.IsAbsent())
        return std::optional<X>{};
      auto r = FromValue<X>::Convert(v);
      if (!r)
        return std::unexpected(std::move(r.error()));
      return std::optional<X>{std::move(*r)};
    }
  };

  template <class X>
  struct FromValue<std::shared_ptr<X>>
  {
    static Expected<std::shared_ptr<X>> Convert(const MetadataValue &v)
    {
      if (v.IsAbsent())
        return std::shared_ptr<X>{};
      auto r = FromValue<std::remove_const_t<X>>::Convert(v);
      if (!r)
        return std::unexpected(std::move(r.error()));
      return std::make_shared<X>(std::move(*r));
    }
  };

  template <class X>
  struct FromValue<std::vector<X>>
  {
    static Expected<std::vector<X>> Convert(const MetadataValue &v)
    {
      if (v.Kind() != ValueKind::List)
        return std::unexpected(detail::KindMismatch(ValueKind::List, v.Kind()));
      const auto &items = v.AsList().items;
      std::vector<X> out;
      out.reserve(items.Size());
      for (NGIN::UIntSize i = 0; i < items.Size(); ++i)
      {
        auto r = FromValue<X>::Convert(items[i]);
        if (!r)
          return std::unexpected(std::move(r.error()));
        out.push_back(std::move(*r));
      }
      return out;
    }
  };

  template <class X>
  struct FromValue<std::vector<std::pair<std::string, X>>>
  {
    static Expected<std::vector<std::pair<std::string, X>>> Convert(const MetadataValue &v)
    {
      if (v.Kind() != ValueKind::Map)
        return std::unexpected(detail::KindMismatch(ValueKind::Map, v.Kind()));
      const auto &entries = v.AsMap().entries;
      std::vector<std::pair<std::string, X>> out;
      out.reserve(entries.Size());
      for (NGIN::UIntSize i = 0; i < entries.Size(); ++i)
      {
        auto r = FromValue<X>::Convert(entries[i].value);
        if (!r)
          return std::unexpected(std::move(r.error()));
        out.emplace_back(entries[i].key, std::move(*r));
      }
      return out;
    }
  };

  template <class X>
  struct FromValue<std::map<std::string, X>>
  {
    static Expected<std::map<std::string, X>> Convert(const MetadataValue &v)
    {
      if (v.Kind() != ValueKind::Map)
        return std::unexpected(detail::KindMismatch(ValueKind::Map, v.Kind()));
      const auto &entries = v.AsMap().entries;
      std::map<std::string, X> out;
      for (NGIN::UIntSize i = 0; i < entries.Size(); ++i)
      {
        auto r = FromValue<X>::Convert(entries[i].value);
        if (!r)
          return std::unexpected(std::move(r.error()));
        out.emplace(entries[i].key, std::move(*r));
      }
      return out;
    }
  };

  template <class X>
    requires detail::DescribedSchema<X>
  struct FromValue<X>
  {
    static Expected<X> Convert(const MetadataValue &v) { return Materialize<X>(v); }
  };

  namespace detail
  {
    template <auto MemberPtr>
    static std::expected<void, Error> ParamStore(void *obj, const MetadataValue &value)
    {
      using C = MemberClassT<MemberPtr>;
      using M = MemberTypeT<MemberPtr>;
      auto r = FromValue<M>::Convert(value);
      if (!r)
        return std::unexpected(std::move(r.error()));
      auto *c = static_cast<C *>(obj);
      (c->*MemberPtr) = std::move(*r);
      return {};
    }
  } // namespace detail

  // Store a derived record into a default-constructed T, member by member.
  template <class T>
  Expected<T> Materialize(const MetadataValue &value)
  {
    static_assert(std::is_default_constructible_v<T>, "schema types must be default constructible");
    const auto id = detail::EnsureSchemaRegistered<T>();
    if (value.Kind() != ValueKind::Record)
      return std::unexpected(detail::KindMismatch(ValueKind::Record, value.Kind()));
    const auto &rec = value.AsRecord();
    if (rec.schema != id)
    {
      std::string msg{"record of schema "};
      msg += rec.schemaName;
      msg += " cannot be stored into ";
      msg += detail::TypeNameOf<T>();
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::move(msg)});
    }
    const auto *desc = FindSchema(id);
    if (!desc || desc->params.Size() != rec.fields.Size())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "record does not match the schema layout"});

    T obj{};
    for (NGIN::UIntSize i = 0; i < rec.fields.Size(); ++i)
    {
      const auto store = FindSchema(id)->params[i].Store;
      auto r = store(&obj, rec.fields[i].value);
      if (!r)
      {
        auto err = std::move(r.error());
        err.message = std::string{rec.fields[i].name} + ": " + err.message;
        return std::unexpected(std::move(err));
      }
    }
    return obj;
  }

} // namespace NGIN::Metadata
