#include <NGIN/Metadata/Engine.hpp>
#include <NGIN/Metadata/Cardinality.hpp>
#include <NGIN/Metadata/Tags.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <string>
#include <vector>

namespace NGIN::Metadata::detail
{

  namespace
  {
    // One successful mapping of a real member by a member parameter.
    struct Mapping
    {
      NGIN::UInt32 member{0};
      std::string_view name{};
      DeclRef decl{};
      MetadataValue value{};
    };

    struct Attempt
    {
      NGIN::UInt32 slot{0};
      std::optional<MetadataValue> value{};
      Diagnostics diagnostics{};
    };

    // Per member parameter state collected while walking the real members.
    struct SlotState
    {
      std::vector<Mapping> mappings;
      NGIN::UInt32 rawCounter{0};
      // A member was consumed twice; NoMatch would only repeat that failure.
      bool tainted{false};
      // A member accepted by this parameter failed to map and was already reported.
      bool explained{false};
    };

    std::string_view MemberKind(Scope scope) noexcept
    {
      return scope == Scope::Interface ? "method" : "parameter";
    }

    std::string JoinNames(const std::vector<Mapping> &mappings, const MatchedSet &positions)
    {
      std::string out;
      for (NGIN::UIntSize i = 0; i < positions.Size(); ++i)
      {
        if (i)
          out += ", ";
        out += fmt::format("`{}`", mappings[positions[i]].name);
      }
      return out;
    }

    void Append(Diagnostics &out, Diagnostics &&from)
    {
      for (NGIN::UIntSize i = 0; i < from.Size(); ++i)
        out.PushBack(std::move(from[i]));
    }

    Attempt TryMap(NGIN::UInt32 slot, const ParamPlan &pp, const Subject &member, const DerivationContext &ctx)
    {
      Attempt a{};
      a.slot = slot;
      const auto &nested = *pp.nested;
      if (pp.MemberEncoding() == Encoding::Verbatim && nested.requiredSubject.IsKnown() && member.Type() != nested.requiredSubject)
      {
        auto d = MakeDiagnostic(DiagnosticCode::NoMatch,
                                fmt::format("{} `{}` has type {} but {} requires {}", ScopeName(member.scope), member.Name(),
                                            member.Type().name, nested.name, nested.requiredSubject.name),
                                pp);
        d.declarations.PushBack(member.Ref());
        a.diagnostics.PushBack(std::move(d));
        return a;
      }
      a.value = BuildRecord(nested, member, ctx, a.diagnostics);
      return a;
    }

    MetadataValue Assemble(const ParamPlan &pp, SlotState &state, const MatchedSet &positions)
    {
      const auto &card = pp.MemberCardinality();
      if (!IsMany(card))
      {
        if (positions.Size() == 0)
          return MetadataValue::Absent();
        return state.mappings[positions[0]].value;
      }
      if (IsNamedMany(card))
      {
        MapValue map;
        for (NGIN::UIntSize i = 0; i < positions.Size(); ++i)
        {
          const auto &m = state.mappings[positions[i]];
          map.entries.PushBack(MapEntry{std::string{m.name}, m.value});
        }
        return MetadataValue::Map(std::move(map));
      }
      ListValue list;
      for (NGIN::UIntSize i = 0; i < positions.Size(); ++i)
        list.items.PushBack(state.mappings[positions[i]].value);
      return MetadataValue::List(std::move(list));
    }
  } // namespace

  NGIN::Containers::Vector<MetadataValue> MapMembers(const SchemaPlan &plan, const Subject &subject, const DerivationContext &ctx,
                                                     Diagnostics &out)
  {
    NGIN::Containers::Vector<MetadataValue> values;
    if (subject.scope == Scope::Parameter)
    {
      for (NGIN::UIntSize s = 0; s < plan.members.Size(); ++s)
        values.PushBack(MetadataValue::Absent());
      return values;
    }

    // Real members in declaration order.
    std::vector<Subject> members;
    if (subject.scope == Scope::Interface)
    {
      const auto &methods = subject.iface->methods;
      for (NGIN::UIntSize i = 0; i < methods.Size(); ++i)
        members.push_back(Subject::Of(*subject.iface, methods[i]));
    }
    else
    {
      const auto &groups = subject.method->groups;
      for (NGIN::UIntSize g = 0; g < groups.Size(); ++g)
        for (NGIN::UIntSize i = 0; i < groups[g].Size(); ++i)
          members.push_back(Subject::Of(*subject.iface, *subject.method, groups[g][i], 0));
    }

    spdlog::debug("mapping {} {}(s) of {} `{}` onto {} parameter(s) of {}", members.size(), MemberKind(subject.scope),
                  ScopeName(subject.scope), subject.Name(), plan.members.Size(), plan.name);

    std::vector<SlotState> slots(plan.members.Size());

    for (NGIN::UIntSize mi = 0; mi < members.size(); ++mi)
    {
      const auto &member = members[mi];
      const auto levels = member.Annotations();
      const auto externalName = member.ExternalName();

      std::vector<NGIN::UInt32> accepting;
      bool consumable = false;
      for (NGIN::UIntSize s = 0; s < plan.members.Size(); ++s)
      {
        const auto &pp = *plan.members[s];
        if (!AcceptsTag(pp.tagRestriction, EffectiveTag(levels, pp.tags)))
          continue;
        const auto matchName = pp.MatchName();
        if (!matchName.empty() && matchName != externalName)
          continue;
        accepting.push_back(static_cast<NGIN::UInt32>(s));
        consumable = consumable || !pp.auxiliary;
      }
      spdlog::trace("{} `{}` accepted by {} parameter(s)", MemberKind(subject.scope), member.Name(), accepting.size());

      if (!consumable && ctx.Options().requireFullCoverage)
      {
        Diagnostic d{};
        d.code = DiagnosticCode::NoMatch;
        d.message = fmt::format("{} `{}` is not consumed by any parameter of {}", MemberKind(subject.scope), member.Name(), plan.name);
        d.schemaLocation = plan.location;
        d.declarations.PushBack(member.Ref());
        out.PushBack(std::move(d));
      }
      if (accepting.empty())
        continue;

      std::vector<Attempt> attempts;
      for (const auto s : accepting)
      {
        Subject target = member;
        target.indexInRaw = slots[s].rawCounter;
        attempts.push_back(TryMap(s, *plan.members[s], target, ctx));
      }

      std::vector<NGIN::UIntSize> consumed;
      bool consumingAttempted = false;
      for (NGIN::UIntSize a = 0; a < attempts.size(); ++a)
      {
        const auto &pp = *plan.members[attempts[a].slot];
        if (pp.auxiliary)
          continue;
        consumingAttempted = true;
        if (attempts[a].value)
          consumed.push_back(a);
      }

      if (consumed.size() > 1)
      {
        std::string owners;
        for (NGIN::UIntSize i = 0; i < consumed.size(); ++i)
        {
          const auto slot = attempts[consumed[i]].slot;
          slots[slot].tainted = true;
          if (i)
            owners += ", ";
          owners += plan.members[slot]->path;
        }
        auto d = MakeDiagnostic(DiagnosticCode::DuplicateConsumption,
                                fmt::format("{} `{}` is consumed by {} parameters: {}", MemberKind(subject.scope), member.Name(),
                                            consumed.size(), owners),
                                *plan.members[attempts[consumed[0]].slot]);
        d.declarations.PushBack(member.Ref());
        out.PushBack(std::move(d));
      }
      else if (consumed.size() == 1)
      {
        auto &attempt = attempts[consumed[0]];
        auto &state = slots[attempt.slot];
        state.mappings.push_back(Mapping{static_cast<NGIN::UInt32>(mi), externalName, member.Ref(), std::move(*attempt.value)});
        ++state.rawCounter;
      }
      else if (consumingAttempted)
      {
        // Accepted by tag but no consuming parameter could map it.
        for (auto &attempt : attempts)
        {
          if (plan.members[attempt.slot]->auxiliary)
            continue;
          slots[attempt.slot].explained = true;
          Append(out, std::move(attempt.diagnostics));
        }
      }

      for (auto &attempt : attempts)
      {
        if (!plan.members[attempt.slot]->auxiliary || !attempt.value)
          continue;
        auto &state = slots[attempt.slot];
        state.mappings.push_back(Mapping{static_cast<NGIN::UInt32>(mi), externalName, member.Ref(), std::move(*attempt.value)});
        ++state.rawCounter;
      }
    }

    for (NGIN::UIntSize s = 0; s < plan.members.Size(); ++s)
    {
      const auto &pp = *plan.members[s];
      auto &state = slots[s];

      NGIN::Containers::Vector<Candidate> candidates;
      for (NGIN::UIntSize i = 0; i < state.mappings.size(); ++i)
        candidates.PushBack(Candidate{state.mappings[i].name, state.mappings[i].member});

      auto matched = ResolveCardinality(pp.MemberCardinality(), candidates);
      if (matched)
      {
        values.PushBack(Assemble(pp, state, *matched));
        continue;
      }

      values.PushBack(MetadataValue::Absent());
      const auto &failure = matched.error();
      switch (failure.code)
      {
      case DiagnosticCode::NoMatch:
      {
        if (state.tainted || state.explained)
          break;
        out.PushBack(MakeDiagnostic(DiagnosticCode::NoMatch,
                                    fmt::format("no {} of {} `{}` matches ({} required)", MemberKind(subject.scope),
                                                ScopeName(subject.scope), subject.Name(), CardinalityName(pp.MemberCardinality())),
                                    pp));
        out[out.Size() - 1].declarations.PushBack(subject.Ref());
        break;
      }
      case DiagnosticCode::AmbiguousMatch:
      {
        auto d = MakeDiagnostic(DiagnosticCode::AmbiguousMatch,
                                fmt::format("{} {}s of {} `{}` match where {} is required: {}", failure.offending.Size(),
                                            MemberKind(subject.scope), ScopeName(subject.scope), subject.Name(),
                                            CardinalityName(pp.MemberCardinality()), JoinNames(state.mappings, failure.offending)),
                                pp);
        for (NGIN::UIntSize i = 0; i < failure.offending.Size(); ++i)
          d.declarations.PushBack(state.mappings[failure.offending[i]].decl);
        out.PushBack(std::move(d));
        break;
      }
      case DiagnosticCode::DuplicateName:
      {
        auto d = MakeDiagnostic(DiagnosticCode::DuplicateName,
                                fmt::format("{}s of {} `{}` share an external name: {}", MemberKind(subject.scope),
                                            ScopeName(subject.scope), subject.Name(), JoinNames(state.mappings, failure.offending)),
                                pp);
        for (NGIN::UIntSize i = 0; i < failure.offending.Size(); ++i)
          d.declarations.PushBack(state.mappings[failure.offending[i]].decl);
        out.PushBack(std::move(d));
        break;
      }
      default:
        out.PushBack(MakeDiagnostic(failure.code, "cardinality resolution failed", pp));
        break;
      }
    }
    return values;
  }

  namespace
  {
    RecordValue AssembleRecord(const SchemaPlan &plan, const Subject &subject, const DerivationContext &ctx,
                               const NGIN::Containers::Vector<MetadataValue> &memberValues, NGIN::UIntSize &cursor,
                               Diagnostics &out)
    {
      RecordValue rec{};
      rec.schema = plan.schema;
      rec.schemaName = plan.name;
      for (NGIN::UIntSize i = 0; i < plan.params.Size(); ++i)
      {
        const auto &pp = plan.params[i];
        MetadataValue value{};
        if (std::holds_alternative<strategy::Embedded>(pp.strategy))
        {
          value = MetadataValue::Record(AssembleRecord(*pp.nested, subject, ctx, memberValues, cursor, out));
        }
        else if (pp.IsMemberParam())
        {
          if (cursor < memberValues.Size())
            value = memberValues[cursor];
          ++cursor;
        }
        else if (auto v = MaterializeDirect(pp, subject, ctx, out))
        {
          value = std::move(*v);
        }
        rec.fields.PushBack(RecordField{pp.name, std::move(value)});
      }
      return rec;
    }
  } // namespace

  std::optional<MetadataValue> BuildRecord(const SchemaPlan &plan, const Subject &subject, const DerivationContext &ctx,
                                           Diagnostics &out)
  {
    const auto before = out.Size();
    const auto memberValues = MapMembers(plan, subject, ctx, out);
    NGIN::UIntSize cursor = 0;
    auto rec = AssembleRecord(plan, subject, ctx, memberValues, cursor, out);
    if (out.Size() > before)
      return std::nullopt;
    return MetadataValue::Record(std::move(rec));
  }

} // namespace NGIN::Metadata::detail
