#include <NGIN/Metadata/Deriver.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <string>

namespace NGIN::Metadata
{

  Expected<MetadataValue> Derive(const SchemaPlan &plan, const InterfaceDecl &iface, const ContextResolver *resolver,
                                 const DeriveOptions &options)
  {
    if (plan.scope != Scope::Interface)
    {
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   fmt::format("schema {} was compiled for {} scope", plan.name, ScopeName(plan.scope))});
    }

    spdlog::debug("deriving {} for interface `{}` ({} method(s))", plan.name, iface.name, iface.methods.Size());

    const detail::DerivationContext ctx{resolver, options};
    Diagnostics diagnostics;
    auto record = detail::BuildRecord(plan, Subject::Of(iface), ctx, diagnostics);
    if (record && diagnostics.Size() == 0)
      return std::move(*record);

    const auto total = diagnostics.Size();
    if (options.maxDiagnostics != 0 && total > options.maxDiagnostics)
    {
      Diagnostics kept;
      kept.Reserve(options.maxDiagnostics);
      for (NGIN::UIntSize i = 0; i < options.maxDiagnostics; ++i)
        kept.PushBack(std::move(diagnostics[i]));
      diagnostics = std::move(kept);
    }
    spdlog::debug("deriving {} for `{}` failed with {} diagnostic(s)", plan.name, iface.name, total);
    return std::unexpected(Error{ErrorCode::Matching,
                                 fmt::format("cannot derive {} for interface `{}`: {} problem(s)", plan.name, iface.name, total),
                                 std::move(diagnostics)});
  }

  namespace
  {
    class Finalizer
    {
    public:
      explicit Finalizer(const ContextResolver *resolver) noexcept : m_resolver(resolver) {}

      MetadataValue Visit(const MetadataValue &value, const std::string &path)
      {
        switch (value.Kind())
        {
        case ValueKind::Context:
          return Resolve(value.AsContext(), path);
        case ValueKind::Record:
        {
          const auto &in = value.AsRecord();
          RecordValue rec{};
          rec.schema = in.schema;
          rec.schemaName = in.schemaName;
          rec.fields.Reserve(in.fields.Size());
          for (NGIN::UIntSize i = 0; i < in.fields.Size(); ++i)
          {
            const auto &f = in.fields[i];
            rec.fields.PushBack(RecordField{f.name, Visit(f.value, fmt::format("{}.{}", path, f.name))});
          }
          return MetadataValue::Record(std::move(rec));
        }
        case ValueKind::List:
        {
          const auto &in = value.AsList();
          ListValue list;
          list.items.Reserve(in.items.Size());
          for (NGIN::UIntSize i = 0; i < in.items.Size(); ++i)
            list.items.PushBack(Visit(in.items[i], fmt::format("{}[{}]", path, i)));
          return MetadataValue::List(std::move(list));
        }
        case ValueKind::Map:
        {
          const auto &in = value.AsMap();
          MapValue map;
          map.entries.Reserve(in.entries.Size());
          for (NGIN::UIntSize i = 0; i < in.entries.Size(); ++i)
          {
            const auto &e = in.entries[i];
            map.entries.PushBack(MapEntry{e.key, Visit(e.value, fmt::format("{}[\"{}\"]", path, e.key))});
          }
          return MetadataValue::Map(std::move(map));
        }
        default:
          return value;
        }
      }

      Diagnostics &Failures() noexcept { return m_failures; }

    private:
      MetadataValue Resolve(const ContextHandle &handle, const std::string &path)
      {
        if (handle.IsResolved())
          return MetadataValue::Context(handle);
        auto instance = m_resolver ? m_resolver->Lookup(handle.Key()) : std::shared_ptr<const Any>{};
        if (!instance)
        {
          Diagnostic d{};
          d.code = DiagnosticCode::LookupFailure;
          d.schemaPath = path;
          if (const auto *origin = handle.Origin())
          {
            d.message = fmt::format("no contextual instance of {} available for {} `{}` (requested by {})", handle.TypeName(),
                                    ScopeName(origin->declaration.scope), origin->declaration.name, origin->schemaPath);
            d.schemaLocation = origin->schemaLocation;
            d.declarations.PushBack(origin->declaration);
          }
          else
          {
            d.message = fmt::format("no contextual instance of {} available", handle.TypeName());
          }
          m_failures.PushBack(std::move(d));
          return MetadataValue::Context(handle);
        }
        return MetadataValue::Context(handle.Resolved(std::move(instance)));
      }

      const ContextResolver *m_resolver{nullptr};
      Diagnostics m_failures{};
    };
  } // namespace

  Expected<MetadataValue> Finalize(const MetadataValue &value, const ContextResolver *resolver)
  {
    Finalizer finalizer{resolver};
    std::string root = "value";
    if (value.Kind() == ValueKind::Record)
      root = std::string{value.AsRecord().schemaName};
    auto out = finalizer.Visit(value, root);
    auto &failures = finalizer.Failures();
    if (failures.Size() != 0)
    {
      const auto count = failures.Size();
      return std::unexpected(Error{ErrorCode::Unresolved,
                                   fmt::format("{} contextual reference(s) could not be resolved", count),
                                   std::move(failures)});
    }
    return out;
  }

  Expected<PlanPtr> Deriver::PlanFor(SchemaId schema)
  {
    if (const auto *slot = m_index.GetPtr(schema))
    {
      const auto &entry = m_entries[*slot];
      if (entry.error)
        return std::unexpected(*entry.error);
      return entry.plan;
    }

    CacheEntry entry{};
    entry.schema = schema;
    auto compiled = CompileSchema(schema);
    if (compiled)
      entry.plan = *compiled;
    else
      entry.error = compiled.error();

    // Unknown schemas are not cached; they may be registered later.
    if (!compiled && compiled.error().code == ErrorCode::NotFound)
      return std::unexpected(std::move(compiled.error()));

    m_index.Insert(schema, static_cast<NGIN::UInt32>(m_entries.Size()));
    m_entries.PushBack(std::move(entry));
    return compiled;
  }

} // namespace NGIN::Metadata
