// Deriver.hpp
// Entry points: derive a schema against an interface, finalize contextual references, typed results.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <NGIN/Metadata/Context.hpp>
#include <NGIN/Metadata/Convert.hpp>
#include <NGIN/Metadata/Engine.hpp>
#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/Interface.hpp>
#include <NGIN/Metadata/Plan.hpp>
#include <NGIN/Metadata/Types.hpp>
#include <NGIN/Metadata/Value.hpp>

#include <optional>
#include <utility>

namespace NGIN::Metadata
{

  // Resolve `plan` against `iface`. Matching failures are aggregated into one
  // ErrorCode::Matching error; non-strict contextual references stay deferred.
  [[nodiscard]] NGIN_METADATA_API Expected<MetadataValue>
  Derive(const SchemaPlan &plan, const InterfaceDecl &iface, const ContextResolver *resolver = nullptr,
         const DeriveOptions &options = {});

  template <class T>
  [[nodiscard]] Expected<MetadataValue> Derive(const InterfaceDecl &iface, const ContextResolver *resolver = nullptr,
                                               const DeriveOptions &options = {})
  {
    auto plan = CompileSchema<T>();
    if (!plan)
      return std::unexpected(std::move(plan.error()));
    return Derive(**plan, iface, resolver, options);
  }

  // Attach instances to every deferred contextual reference. Unresolvable references are
  // reported as LookupFailure diagnostics under ErrorCode::Unresolved.
  [[nodiscard]] NGIN_METADATA_API Expected<MetadataValue> Finalize(const MetadataValue &value, const ContextResolver *resolver);

  // Caches compiled plans (or their configuration error) per schema.
  class NGIN_METADATA_API Deriver
  {
  public:
    [[nodiscard]] Expected<PlanPtr> PlanFor(SchemaId schema);
    template <class T>
    [[nodiscard]] Expected<PlanPtr> PlanFor()
    {
      return PlanFor(SchemaIdOf<T>());
    }

    template <class T>
    [[nodiscard]] Expected<MetadataValue> Derive(const InterfaceDecl &iface, const ContextResolver *resolver = nullptr,
                                                 const DeriveOptions &options = {})
    {
      auto plan = PlanFor<T>();
      if (!plan)
        return std::unexpected(std::move(plan.error()));
      return NGIN::Metadata::Derive(**plan, iface, resolver, options);
    }

    template <class T>
    [[nodiscard]] Expected<T> DeriveAs(const InterfaceDecl &iface, const ContextResolver *resolver = nullptr,
                                       const DeriveOptions &options = {})
    {
      auto value = Derive<T>(iface, resolver, options);
      if (!value)
        return std::unexpected(std::move(value.error()));
      if (options.finalize)
      {
        auto finalized = Finalize(*value, resolver);
        if (!finalized)
          return std::unexpected(std::move(finalized.error()));
        return Materialize<T>(*finalized);
      }
      return Materialize<T>(*value);
    }

    [[nodiscard]] NGIN::UIntSize CachedPlanCount() const noexcept { return m_entries.Size(); }

  private:
    struct CacheEntry
    {
      SchemaId schema{0};
      PlanPtr plan{};
      std::optional<Error> error{};
    };

    NGIN::Containers::Vector<CacheEntry> m_entries{};
    NGIN::Containers::FlatHashMap<SchemaId, NGIN::UInt32> m_index{};
  };

} // namespace NGIN::Metadata
