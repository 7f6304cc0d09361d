// Plan.hpp
// Validated, scope-resolved form of a schema, compiled once and reused across interfaces.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/Interface.hpp>
#include <NGIN/Metadata/Registry.hpp>
#include <NGIN/Metadata/Strategy.hpp>
#include <NGIN/Metadata/Types.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace NGIN::Metadata
{

  struct SchemaPlan;

  struct ParamPlan
  {
    std::string_view name{};
    SourceLocation location{};
    // Owner chain, e.g. "RestMeta::gets > GetMeta::args".
    std::string path{};
    Strategy strategy{strategy::Unrecognized{}};
    ValueShape shape{ValueShape::Plain};
    TypeRef lookupType{};
    // Embedded, PerMethod and PerParameter.
    std::shared_ptr<const SchemaPlan> nested{};
    // Members matched by PerMethod/PerParameter: restriction and the tag configuration used
    // to compute their effective tag.
    AnnotationTypeId tagRestriction{0};
    TagConfig tags{};
    bool auxiliary{false};

    [[nodiscard]] bool IsMemberParam() const noexcept
    {
      return std::holds_alternative<strategy::PerMethod>(strategy) || std::holds_alternative<strategy::PerParameter>(strategy);
    }
    [[nodiscard]] NGIN_METADATA_API const Cardinality &MemberCardinality() const;
    [[nodiscard]] NGIN_METADATA_API Encoding MemberEncoding() const;
    [[nodiscard]] NGIN_METADATA_API std::string_view MatchName() const;
  };

  struct SchemaPlan
  {
    SchemaId schema{0};
    std::string_view name{};
    Scope scope{Scope::Interface};
    SourceLocation location{};
    TypeRef requiredSubject{};
    NGIN::Containers::Vector<ParamPlan> params{};
    // Member-matching parameters of this schema and of its embedded schemas, in the order
    // they are assembled.
    NGIN::Containers::Vector<const ParamPlan *> members{};
  };

  using PlanPtr = std::shared_ptr<const SchemaPlan>;

  // Validate a registered schema for use at `scope`. The first configuration problem is returned
  // as an ErrorCode::SchemaConfiguration error; self-embedding is reported as DiagnosticCode::Cycle.
  [[nodiscard]] NGIN_METADATA_API Expected<PlanPtr> CompileSchema(SchemaId schema, Scope scope = Scope::Interface);

  template <class T>
  [[nodiscard]] Expected<PlanPtr> CompileSchema(Scope scope = Scope::Interface)
  {
    return CompileSchema(SchemaIdOf<T>(), scope);
  }

} // namespace NGIN::Metadata
