#include <NGIN/Metadata/Cardinality.hpp>

namespace NGIN::Metadata
{

  namespace
  {
    MatchedSet All(const NGIN::Containers::Vector<Candidate> &candidates)
    {
      MatchedSet out;
      out.Reserve(candidates.Size());
      for (NGIN::UIntSize i = 0; i < candidates.Size(); ++i)
        out.PushBack(static_cast<NGIN::UInt32>(i));
      return out;
    }

    CardinalityFailure Fail(DiagnosticCode code, MatchedSet offending)
    {
      CardinalityFailure f{};
      f.code = code;
      f.offending = std::move(offending);
      return f;
    }
  } // namespace

  std::expected<MatchedSet, CardinalityFailure>
  ResolveCardinality(const Cardinality &cardinality, const NGIN::Containers::Vector<Candidate> &candidates)
  {
    if (std::holds_alternative<ExactlyOne>(cardinality))
    {
      if (candidates.Size() == 0)
        return std::unexpected(Fail(DiagnosticCode::NoMatch, {}));
      if (candidates.Size() > 1)
        return std::unexpected(Fail(DiagnosticCode::AmbiguousMatch, All(candidates)));
      return All(candidates);
    }
    if (std::holds_alternative<ZeroOrOne>(cardinality))
    {
      if (candidates.Size() > 1)
        return std::unexpected(Fail(DiagnosticCode::AmbiguousMatch, All(candidates)));
      return All(candidates);
    }

    const auto &many = std::get<Many>(cardinality);
    if (many.naming == Naming::Positional)
      return All(candidates);

    // Every candidate whose name is shared with another one is offending.
    MatchedSet colliding;
    for (NGIN::UIntSize i = 0; i < candidates.Size(); ++i)
    {
      for (NGIN::UIntSize j = 0; j < candidates.Size(); ++j)
      {
        if (i != j && candidates[i].name == candidates[j].name)
        {
          colliding.PushBack(static_cast<NGIN::UInt32>(i));
          break;
        }
      }
    }
    if (colliding.Size() > 0)
      return std::unexpected(Fail(DiagnosticCode::DuplicateName, std::move(colliding)));
    return All(candidates);
  }

} // namespace NGIN::Metadata
