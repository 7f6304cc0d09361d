// Cardinality.hpp
// Applies exactly-one / zero-or-one / many semantics to a filtered candidate set.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/Strategy.hpp>
#include <NGIN/Metadata/Types.hpp>

#include <expected>
#include <string_view>

namespace NGIN::Metadata
{

  struct Candidate
  {
    // Resolved name; only consulted by name-keyed Many.
    std::string_view name{};
    // Original index of the candidate (declaration order).
    NGIN::UInt32 index{0};
  };

  struct CardinalityFailure
  {
    DiagnosticCode code{DiagnosticCode::NoMatch};
    // Positions into the candidate sequence of every offending candidate.
    NGIN::Containers::Vector<NGIN::UInt32> offending{};
  };

  // Positions of the selected candidates, in declaration order.
  using MatchedSet = NGIN::Containers::Vector<NGIN::UInt32>;

  [[nodiscard]] NGIN_METADATA_API std::expected<MatchedSet, CardinalityFailure>
  ResolveCardinality(const Cardinality &cardinality, const NGIN::Containers::Vector<Candidate> &candidates);

} // namespace NGIN::Metadata
