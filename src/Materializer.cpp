#include <NGIN/Metadata/Engine.hpp>
#include <NGIN/Metadata/Annotations.hpp>
#include <NGIN/Metadata/Cardinality.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <string>

namespace NGIN::Metadata
{

  Subject Subject::Of(const InterfaceDecl &iface) noexcept
  {
    Subject s{};
    s.scope = Scope::Interface;
    s.iface = &iface;
    return s;
  }

  Subject Subject::Of(const InterfaceDecl &iface, const MethodDecl &method) noexcept
  {
    Subject s{};
    s.scope = Scope::Method;
    s.iface = &iface;
    s.method = &method;
    return s;
  }

  Subject Subject::Of(const InterfaceDecl &iface, const MethodDecl &method, const ParamDecl &param, NGIN::UInt32 indexInRaw) noexcept
  {
    Subject s{};
    s.scope = Scope::Parameter;
    s.iface = &iface;
    s.method = &method;
    s.param = &param;
    s.indexInRaw = indexInRaw;
    return s;
  }

  std::string_view Subject::Name() const noexcept
  {
    switch (scope)
    {
    case Scope::Interface:
      return iface ? iface->name : std::string_view{};
    case Scope::Method:
      return method ? method->name : std::string_view{};
    case Scope::Parameter:
      return param ? param->name : std::string_view{};
    }
    return {};
  }

  std::string_view Subject::ExternalName() const noexcept
  {
    const auto levels = Annotations();
    if (const auto *a = levels.FindFirst(ExternalNameType()))
    {
      if (auto alias = a->FindString("name"))
        return *alias;
    }
    return Name();
  }

  TypeRef Subject::Type() const noexcept
  {
    switch (scope)
    {
    case Scope::Interface:
      return iface ? iface->type : TypeRef{};
    case Scope::Method:
      return method ? method->resultType : TypeRef{};
    case Scope::Parameter:
      return param ? param->type : TypeRef{};
    }
    return {};
  }

  DeclRef Subject::Ref() const noexcept
  {
    DeclRef r{};
    r.scope = scope;
    r.name = Name();
    switch (scope)
    {
    case Scope::Interface:
      r.location = iface ? iface->location : SourceLocation{};
      break;
    case Scope::Method:
      r.location = method ? method->location : SourceLocation{};
      break;
    case Scope::Parameter:
      r.location = param ? param->location : SourceLocation{};
      break;
    }
    return r;
  }

  AnnotationLevels Subject::Annotations() const
  {
    switch (scope)
    {
    case Scope::Interface:
      return AnnotationsOf(*iface);
    case Scope::Method:
      return AnnotationsOf(*method);
    case Scope::Parameter:
      return AnnotationsOf(*method, *param);
    }
    return {};
  }

} // namespace NGIN::Metadata

namespace NGIN::Metadata::detail
{

  namespace
  {
    std::string Describe(const Subject &subject)
    {
      return fmt::format("{} `{}`", ScopeName(subject.scope), subject.Name());
    }

    std::optional<MetadataValue> Reject(Diagnostics &out, Diagnostic d, const Subject &subject)
    {
      d.declarations.PushBack(subject.Ref());
      out.PushBack(std::move(d));
      return std::nullopt;
    }

    // Direct strategies; nested strategies never reach the materializer.
    struct DirectVisitor
    {
      const ParamPlan &param;
      const Subject &subject;
      const DerivationContext &ctx;
      Diagnostics &out;

      std::optional<MetadataValue> operator()(const strategy::ContextualLookup &s) const
      {
        const ContextKey key{s.requested.id, s.bySubjectType ? subject.Type().id : 0};
        ContextHandle handle{key, s.requested.name};
        handle.SetOrigin(ContextOrigin{param.path, param.location, subject.Ref()});
        if (!s.strict)
          return MetadataValue::Context(std::move(handle));

        const auto *resolver = ctx.Resolver();
        auto instance = resolver ? resolver->LookupStrict(key) : std::shared_ptr<const Any>{};
        if (!instance)
        {
          return Reject(out,
                        MakeDiagnostic(DiagnosticCode::LookupFailure,
                                       fmt::format("no contextual instance of {} available for {}", s.requested.name, Describe(subject)),
                                       param),
                        subject);
        }
        return MetadataValue::Context(handle.Resolved(std::move(instance)));
      }

      std::optional<MetadataValue> operator()(const strategy::CaptureAnnotation &s) const
      {
        const auto levels = subject.Annotations();

        if (IsMany(s.cardinality))
        {
          ListValue list;
          for (NGIN::UIntSize l = 0; l < levels.LevelCount(); ++l)
          {
            const auto &level = levels.Level(l);
            for (NGIN::UIntSize i = 0; i < level.Size(); ++i)
              if (level[i].IsA(s.type))
                list.items.PushBack(MetadataValue::Annotation(level[i]));
          }
          return MetadataValue::List(std::move(list));
        }

        // Single captures use the nearest level carrying a candidate; ambiguity is judged within it.
        const Annotations *found = nullptr;
        NGIN::Containers::Vector<Candidate> candidates;
        NGIN::Containers::Vector<const NGIN::Metadata::Annotation *> instances;
        for (NGIN::UIntSize l = 0; l < levels.LevelCount() && !found; ++l)
        {
          const auto &level = levels.Level(l);
          for (NGIN::UIntSize i = 0; i < level.Size(); ++i)
          {
            if (!level[i].IsA(s.type))
              continue;
            candidates.PushBack(Candidate{level[i].TypeName(), static_cast<NGIN::UInt32>(i)});
            instances.PushBack(&level[i]);
            found = &level;
          }
        }

        auto matched = ResolveCardinality(s.cardinality, candidates);
        if (!matched)
        {
          const auto typeName = AnnotationTypeName(s.type);
          if (matched.error().code == DiagnosticCode::NoMatch)
          {
            return Reject(out,
                          MakeDiagnostic(DiagnosticCode::NoMatch,
                                         fmt::format("no annotation of type {} on {}", typeName, Describe(subject)), param),
                          subject);
          }
          std::string names;
          for (NGIN::UIntSize i = 0; i < candidates.Size(); ++i)
          {
            if (i)
              names += ", ";
            names += candidates[i].name;
          }
          return Reject(out,
                        MakeDiagnostic(DiagnosticCode::AmbiguousMatch,
                                       fmt::format("{} annotations of type {} on {}: {}", candidates.Size(), typeName,
                                                   Describe(subject), names),
                                       param),
                        subject);
        }
        if (matched->Size() == 0)
          return MetadataValue::Absent();
        return MetadataValue::Annotation(*instances[(*matched)[0]]);
      }

      std::optional<MetadataValue> operator()(const strategy::CaptureName &s) const
      {
        return MetadataValue::String(std::string{s.useExternalName ? subject.ExternalName() : subject.Name()});
      }

      std::optional<MetadataValue> operator()(const strategy::CapturePosition &) const
      {
        if (!subject.param)
          return Reject(out, MakeDiagnostic(DiagnosticCode::SchemaConfiguration, "position requested outside parameter scope", param), subject);
        ParamPosition pos{};
        pos.index = subject.param->index;
        pos.indexOfGroup = subject.param->groupIndex;
        pos.indexInGroup = subject.param->indexInGroup;
        pos.indexInRaw = subject.indexInRaw;
        return MetadataValue::Position(pos);
      }

      std::optional<MetadataValue> operator()(const strategy::CaptureFlags &) const
      {
        if (!subject.param)
          return Reject(out, MakeDiagnostic(DiagnosticCode::SchemaConfiguration, "flags requested outside parameter scope", param), subject);
        return MetadataValue::Flags(subject.param->flags);
      }

      std::optional<MetadataValue> operator()(const strategy::PresenceCheck &s) const
      {
        return MetadataValue::Bool(subject.Annotations().Contains(s.type));
      }

      std::optional<MetadataValue> operator()(const strategy::Embedded &) const { return NotDirect(); }
      std::optional<MetadataValue> operator()(const strategy::PerMethod &) const { return NotDirect(); }
      std::optional<MetadataValue> operator()(const strategy::PerParameter &) const { return NotDirect(); }
      std::optional<MetadataValue> operator()(const strategy::Unrecognized &s) const
      {
        return Reject(out, MakeDiagnostic(DiagnosticCode::SchemaConfiguration, fmt::format("unrecognized strategy: {}", s.reason), param),
                      subject);
      }

      std::optional<MetadataValue> NotDirect() const
      {
        return Reject(out,
                      MakeDiagnostic(DiagnosticCode::SchemaConfiguration,
                                     fmt::format("{} is resolved by the member mapper", StrategyName(param.strategy)), param),
                      subject);
      }
    };
  } // namespace

  std::optional<MetadataValue> MaterializeDirect(const ParamPlan &param, const Subject &subject, const DerivationContext &ctx,
                                                 Diagnostics &out)
  {
    spdlog::trace("materializing {} ({}) for {}", param.path, StrategyName(param.strategy), Describe(subject));
    return std::visit(DirectVisitor{param, subject, ctx, out}, param.strategy);
  }

} // namespace NGIN::Metadata::detail
