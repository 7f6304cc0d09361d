#include <NGIN/Metadata/Plan.hpp>
#include <NGIN/Metadata/Annotations.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace NGIN::Metadata
{

  const Cardinality &ParamPlan::MemberCardinality() const
  {
    if (const auto *m = std::get_if<strategy::PerMethod>(&strategy))
      return m->cardinality;
    if (const auto *p = std::get_if<strategy::PerParameter>(&strategy))
      return p->cardinality;
    if (const auto *a = std::get_if<strategy::CaptureAnnotation>(&strategy))
      return a->cardinality;
    static const Cardinality exactlyOne{ExactlyOne{}};
    return exactlyOne;
  }

  Encoding ParamPlan::MemberEncoding() const
  {
    if (const auto *m = std::get_if<strategy::PerMethod>(&strategy))
      return m->encoding;
    if (const auto *p = std::get_if<strategy::PerParameter>(&strategy))
      return p->encoding;
    return Encoding::Verbatim;
  }

  std::string_view ParamPlan::MatchName() const
  {
    if (const auto *m = std::get_if<strategy::PerMethod>(&strategy))
      return m->matchName;
    if (const auto *p = std::get_if<strategy::PerParameter>(&strategy))
      return p->matchName;
    return {};
  }

  namespace
  {
    // Tag configuration visible while compiling one schema.
    struct TagScope
    {
      TagConfig methodTags{};
      TagConfig paramTags{};
      // Set by a PerMethod parameter's own ParamTags; wins over the method schema's configuration.
      TagConfig forcedParamTags{};
    };

    struct Frame
    {
      SchemaId schema{0};
      Scope scope{Scope::Interface};
    };

    Cardinality ShapeCardinality(ValueShape shape) noexcept
    {
      switch (shape)
      {
      case ValueShape::Plain:
        return ExactlyOne{};
      case ValueShape::Optional:
        return ZeroOrOne{};
      case ValueShape::List:
        return Many{Naming::Positional};
      case ValueShape::NamedList:
      case ValueShape::NamedMap:
        return Many{Naming::Named};
      }
      return ExactlyOne{};
    }

    bool ShapeAgrees(const Cardinality &c, ValueShape shape) noexcept
    {
      if (std::holds_alternative<ExactlyOne>(c))
        return shape == ValueShape::Plain;
      if (std::holds_alternative<ZeroOrOne>(c))
        return shape == ValueShape::Optional;
      if (std::get<Many>(c).naming == Naming::Named)
        return shape == ValueShape::NamedList || shape == ValueShape::NamedMap;
      return shape == ValueShape::List;
    }

    std::string TypeLabel(AnnotationTypeId id)
    {
      const auto name = AnnotationTypeName(id);
      return name.empty() ? std::string{"<unregistered annotation>"} : std::string{name};
    }

    using Problem = std::optional<std::string>;

    // Per-strategy shape, scope and value-type rules.
    struct Validator
    {
      const SchemaParamDesc &desc;
      Scope scope;
      const TagScope &tags;

      Problem ExpectElement(ElementKind kind, std::string_view strategyName) const
      {
        if (desc.element != kind)
          return fmt::format("{} requires a {} member, found {}", strategyName, ElementKindName(kind), desc.memberType.name);
        return std::nullopt;
      }

      Problem ExpectPlain(std::string_view strategyName) const
      {
        if (desc.shape != ValueShape::Plain)
          return fmt::format("{} cannot fill a {} member", strategyName, ValueShapeName(desc.shape));
        return std::nullopt;
      }

      Problem ExpectScope(Scope required, std::string_view strategyName) const
      {
        if (scope != required)
          return fmt::format("{} is only legal on {}-scope schemas, used at {} scope", strategyName, ScopeName(required),
                             ScopeName(scope));
        return std::nullopt;
      }

      Problem ExpectShape(const Cardinality &c) const
      {
        if (!ShapeAgrees(c, desc.shape))
          return fmt::format("cardinality {} does not fit a {} member", CardinalityName(c), ValueShapeName(desc.shape));
        return std::nullopt;
      }

      Problem ExpectTagWithin(AnnotationTypeId tag, const TagConfig &config) const
      {
        if (tag != 0 && config.IsSet() && !IsRefinementOf(tag, config.base))
          return fmt::format("tag {} does not refine the tag base {}", TypeLabel(tag), TypeLabel(config.base));
        return std::nullopt;
      }

      Problem operator()(const strategy::ContextualLookup &s) const
      {
        if (auto p = ExpectElement(ElementKind::Context, "ContextualLookup"))
          return p;
        if (auto p = ExpectPlain("ContextualLookup"))
          return p;
        if (!s.requested.IsKnown())
          return std::string{"ContextualLookup has no requested type"};
        return std::nullopt;
      }
      Problem operator()(const strategy::CaptureAnnotation &s) const
      {
        if (auto p = ExpectElement(ElementKind::Annotation, "CaptureAnnotation"))
          return p;
        if (s.type == 0)
          return std::string{"CaptureAnnotation has no annotation type"};
        if (IsNamedMany(s.cardinality))
          return std::string{"annotation captures cannot be name-keyed"};
        return ExpectShape(s.cardinality);
      }
      Problem operator()(const strategy::CaptureName &) const
      {
        if (auto p = ExpectElement(ElementKind::String, "CaptureName"))
          return p;
        return ExpectPlain("CaptureName");
      }
      Problem operator()(const strategy::CapturePosition &) const
      {
        if (auto p = ExpectElement(ElementKind::Position, "CapturePosition"))
          return p;
        if (auto p = ExpectPlain("CapturePosition"))
          return p;
        return ExpectScope(Scope::Parameter, "CapturePosition");
      }
      Problem operator()(const strategy::CaptureFlags &) const
      {
        if (auto p = ExpectElement(ElementKind::Flags, "CaptureFlags"))
          return p;
        if (auto p = ExpectPlain("CaptureFlags"))
          return p;
        return ExpectScope(Scope::Parameter, "CaptureFlags");
      }
      Problem operator()(const strategy::PresenceCheck &s) const
      {
        if (auto p = ExpectElement(ElementKind::Bool, "PresenceCheck"))
          return p;
        if (s.type == 0)
          return std::string{"PresenceCheck has no annotation type"};
        return ExpectPlain("PresenceCheck");
      }
      Problem operator()(const strategy::Embedded &) const
      {
        if (auto p = ExpectElement(ElementKind::Schema, "Embedded"))
          return p;
        return ExpectPlain("Embedded");
      }
      Problem operator()(const strategy::PerMethod &s) const
      {
        if (auto p = ExpectScope(Scope::Interface, "PerMethod"))
          return p;
        if (auto p = ExpectElement(ElementKind::Schema, "PerMethod"))
          return p;
        if (std::holds_alternative<Many>(s.cardinality) && !IsNamedMany(s.cardinality))
          return std::string{"PerMethod with many cardinality must be name-keyed"};
        if (auto p = ExpectShape(s.cardinality))
          return p;
        if (desc.qualifiers.auxiliary)
          return std::string{"Auxiliary only applies to PerParameter"};
        return ExpectTagWithin(s.tag, tags.methodTags);
      }
      Problem operator()(const strategy::PerParameter &s) const
      {
        if (auto p = ExpectScope(Scope::Method, "PerParameter"))
          return p;
        if (auto p = ExpectElement(ElementKind::Schema, "PerParameter"))
          return p;
        if (auto p = ExpectShape(s.cardinality))
          return p;
        if (desc.qualifiers.paramTags.IsSet())
          return std::string{"ParamTags only applies to PerMethod"};
        return ExpectTagWithin(s.tag, tags.paramTags);
      }
      Problem operator()(const strategy::Unrecognized &s) const
      {
        return fmt::format("unrecognized strategy: {}", s.reason);
      }
    };

    // Qualifiers that only make sense for some strategies.
    Problem ValidateQualifiers(const Strategy &s, const Qualifiers &q)
    {
      const bool lookup = std::holds_alternative<strategy::ContextualLookup>(s);
      const bool member = std::holds_alternative<strategy::PerMethod>(s) || std::holds_alternative<strategy::PerParameter>(s);
      const bool annotation = std::holds_alternative<strategy::CaptureAnnotation>(s);
      if ((q.strict || q.bySubjectType) && !lookup)
        return std::string{"Checked and ForSubjectType only apply to contextual lookups"};
      if (!member && (q.tag != 0 || q.auxiliary || q.encoding || !q.matchName.empty() || q.paramTags.IsSet()))
        return std::string{"matching qualifiers only apply to PerMethod and PerParameter"};
      if (q.cardinality && !member && !annotation)
        return std::string{"cardinality only applies to PerMethod, PerParameter and CaptureAnnotation"};
      return std::nullopt;
    }

    class Compiler
    {
    public:
      Expected<PlanPtr> Compile(SchemaId id, Scope scope, const TagScope &inherited, const std::string &ownerPath)
      {
        const auto *desc = FindSchema(id);
        if (!desc)
          return std::unexpected(Error{ErrorCode::NotFound, fmt::format("schema {:#x} is not registered", id)});

        for (const auto &frame : m_stack)
        {
          if (frame.schema == id && frame.scope == scope)
          {
            Diagnostic d{};
            d.code = DiagnosticCode::Cycle;
            d.message = fmt::format("schema {} embeds itself at {} scope", desc->name, ScopeName(scope));
            d.schemaPath = ownerPath;
            d.schemaLocation = desc->location;
            Diagnostics diags;
            diags.PushBack(std::move(d));
            return std::unexpected(Error{ErrorCode::SchemaConfiguration,
                                         fmt::format("invalid schema {}: cyclic embedding", desc->name), std::move(diags)});
          }
        }

        m_stack.push_back(Frame{id, scope});
        auto result = CompileBody(*desc, scope, inherited, ownerPath);
        m_stack.pop_back();
        return result;
      }

    private:
      Expected<PlanPtr> CompileBody(const SchemaDesc &desc, Scope scope, const TagScope &inherited, const std::string &ownerPath)
      {
        TagScope tags = inherited;
        if (desc.methodTags.IsSet())
          tags.methodTags = desc.methodTags;
        if (tags.forcedParamTags.IsSet())
          tags.paramTags = tags.forcedParamTags;
        else if (desc.paramTags.IsSet())
          tags.paramTags = desc.paramTags;

        auto plan = std::make_shared<SchemaPlan>();
        plan->schema = desc.id;
        plan->name = desc.name;
        plan->scope = scope;
        plan->location = desc.location;
        plan->requiredSubject = desc.requiredSubject;

        for (NGIN::UIntSize i = 0; i < desc.params.Size(); ++i)
        {
          const auto &p = desc.params[i];
          ParamPlan pp{};
          pp.name = p.name;
          pp.location = p.location;
          pp.path = ownerPath.empty() ? fmt::format("{}::{}", desc.name, p.name)
                                      : fmt::format("{} > {}::{}", ownerPath, desc.name, p.name);
          pp.shape = p.shape;
          pp.lookupType = p.lookupType;

          ClassifyInput in{};
          in.scope = scope;
          in.qualifiers = &p.qualifiers;
          in.contextual = p.element == ElementKind::Context;
          in.lookupType = p.lookupType;
          in.nestedSchema = p.nestedSchema;
          in.shapeCardinality = ShapeCardinality(p.shape);
          pp.strategy = Classify(in);

          Problem problem = std::visit(Validator{p, scope, tags}, pp.strategy);
          if (!problem)
            problem = ValidateQualifiers(pp.strategy, p.qualifiers);
          if (p.name.empty() && !problem)
            problem = std::string{"schema parameter has no name"};
          if (problem)
            return std::unexpected(ConfigurationError(desc, pp, std::move(*problem)));

          if (const auto *e = std::get_if<strategy::Embedded>(&pp.strategy))
          {
            auto child = Compile(e->schema, scope, tags, pp.path);
            if (!child)
              return std::unexpected(std::move(child.error()));
            pp.nested = std::move(*child);
          }
          else if (const auto *m = std::get_if<strategy::PerMethod>(&pp.strategy))
          {
            TagScope childTags = tags;
            childTags.forcedParamTags = m->paramTags;
            auto child = Compile(m->schema, Scope::Method, childTags, pp.path);
            if (!child)
              return std::unexpected(std::move(child.error()));
            pp.nested = std::move(*child);
            pp.tagRestriction = m->tag != 0 ? m->tag : tags.methodTags.base;
            pp.tags = tags.methodTags.IsSet() ? tags.methodTags : TagConfig{m->tag, 0};
          }
          else if (const auto *pr = std::get_if<strategy::PerParameter>(&pp.strategy))
          {
            TagScope childTags = tags;
            childTags.forcedParamTags = TagConfig{};
            auto child = Compile(pr->schema, Scope::Parameter, childTags, pp.path);
            if (!child)
              return std::unexpected(std::move(child.error()));
            pp.nested = std::move(*child);
            pp.tagRestriction = pr->tag != 0 ? pr->tag : tags.paramTags.base;
            pp.tags = tags.paramTags.IsSet() ? tags.paramTags : TagConfig{pr->tag, 0};
            pp.auxiliary = pr->auxiliary;
          }

          plan->params.PushBack(std::move(pp));
        }

        CollectMembers(*plan, plan->members);
        spdlog::debug("compiled schema {} at {} scope: {} parameter(s), {} member parameter(s)", plan->name,
                      ScopeName(scope), plan->params.Size(), plan->members.Size());
        return PlanPtr{std::move(plan)};
      }

      static void CollectMembers(const SchemaPlan &plan, NGIN::Containers::Vector<const ParamPlan *> &out)
      {
        for (NGIN::UIntSize i = 0; i < plan.params.Size(); ++i)
        {
          const auto &pp = plan.params[i];
          if (std::holds_alternative<strategy::Embedded>(pp.strategy))
            CollectMembers(*pp.nested, out);
          else if (pp.IsMemberParam())
            out.PushBack(&pp);
        }
      }

      static Error ConfigurationError(const SchemaDesc &desc, const ParamPlan &pp, std::string problem)
      {
        Diagnostic d{};
        d.code = DiagnosticCode::SchemaConfiguration;
        d.message = problem;
        d.schemaPath = pp.path;
        d.schemaLocation = pp.location;
        Diagnostics diags;
        diags.PushBack(std::move(d));
        spdlog::debug("schema {} rejected: {}", desc.name, problem);
        return Error{ErrorCode::SchemaConfiguration, fmt::format("invalid schema {}: {}", desc.name, problem), std::move(diags)};
      }

      std::vector<Frame> m_stack{};
    };
  } // namespace

  Expected<PlanPtr> CompileSchema(SchemaId schema, Scope scope)
  {
    Compiler compiler;
    return compiler.Compile(schema, scope, TagScope{}, std::string{});
  }

} // namespace NGIN::Metadata
