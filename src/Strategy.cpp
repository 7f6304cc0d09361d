#include <NGIN/Metadata/Strategy.hpp>

namespace NGIN::Metadata
{

  namespace
  {
    template <class... Fs>
    struct Overloaded : Fs...
    {
      using Fs::operator()...;
    };
    template <class... Fs>
    Overloaded(Fs...) -> Overloaded<Fs...>;

    Encoding DefaultEncoding(const Cardinality &c) noexcept
    {
      return IsMany(c) ? Encoding::Encoded : Encoding::Verbatim;
    }
  } // namespace

  std::string_view CardinalityName(const Cardinality &c) noexcept
  {
    return std::visit(Overloaded{
                          [](const ExactlyOne &) -> std::string_view { return "exactly one"; },
                          [](const ZeroOrOne &) -> std::string_view { return "zero or one"; },
                          [](const Many &m) -> std::string_view { return m.naming == Naming::Named ? "many (named)" : "many"; },
                      },
                      c);
  }

  std::string_view StrategyName(const Strategy &s) noexcept
  {
    return std::visit(Overloaded{
                          [](const strategy::ContextualLookup &) -> std::string_view { return "ContextualLookup"; },
                          [](const strategy::CaptureAnnotation &) -> std::string_view { return "CaptureAnnotation"; },
                          [](const strategy::CaptureName &) -> std::string_view { return "CaptureName"; },
                          [](const strategy::CapturePosition &) -> std::string_view { return "CapturePosition"; },
                          [](const strategy::CaptureFlags &) -> std::string_view { return "CaptureFlags"; },
                          [](const strategy::PresenceCheck &) -> std::string_view { return "PresenceCheck"; },
                          [](const strategy::Embedded &) -> std::string_view { return "Embedded"; },
                          [](const strategy::PerMethod &) -> std::string_view { return "PerMethod"; },
                          [](const strategy::PerParameter &) -> std::string_view { return "PerParameter"; },
                          [](const strategy::Unrecognized &) -> std::string_view { return "Unrecognized"; },
                      },
                      s);
  }

  std::string_view MarkerName(Marker m) noexcept
  {
    switch (m)
    {
    case Marker::Embedded:
      return "Embedded";
    case Marker::Methods:
      return "Methods";
    case Marker::Parameters:
      return "Parameters";
    case Marker::Lookup:
      return "Lookup";
    case Marker::Annotation:
      return "Annotation";
    case Marker::Name:
      return "Name";
    case Marker::Position:
      return "Position";
    case Marker::Flags:
      return "Flags";
    case Marker::Presence:
      return "Has";
    }
    return "unknown";
  }

  Strategy Classify(const ClassifyInput &input)
  {
    const auto &q = *input.qualifiers;

    // Embedded outranks every other marker. Among the rest, repeating one is harmless
    // and two different ones conflict.
    bool embedded = false;
    for (NGIN::UIntSize i = 0; i < q.markers.Size(); ++i)
      embedded = embedded || q.markers[i] == Marker::Embedded;
    if (embedded)
    {
      if (input.nestedSchema == 0)
        return strategy::Unrecognized{"Embedded requires a described schema type"};
      return strategy::Embedded{input.nestedSchema};
    }
    for (NGIN::UIntSize i = 1; i < q.markers.Size(); ++i)
    {
      if (q.markers[i] != q.markers[0])
        return strategy::Unrecognized{"conflicting strategy qualifiers"};
    }

    const auto cardinality = q.cardinality.value_or(input.shapeCardinality);

    if (q.markers.Size() == 0)
    {
      if (input.contextual)
        return strategy::ContextualLookup{input.lookupType, q.strict, q.bySubjectType};
      if (input.nestedSchema == 0)
        return strategy::Unrecognized{"no strategy qualifier and no applicable default"};
      switch (input.scope)
      {
      case Scope::Interface:
        return strategy::PerMethod{input.nestedSchema, cardinality, q.encoding.value_or(DefaultEncoding(cardinality)),
                                   q.tag, q.paramTags, q.matchName};
      case Scope::Method:
        return strategy::PerParameter{input.nestedSchema, cardinality, q.encoding.value_or(DefaultEncoding(cardinality)),
                                      q.tag, q.auxiliary, q.matchName};
      case Scope::Parameter:
        return strategy::Unrecognized{"parameter-scope schemas require an explicit strategy"};
      }
      return strategy::Unrecognized{"unknown scope"};
    }

    switch (q.markers[0])
    {
    case Marker::Embedded:
      if (input.nestedSchema == 0)
        return strategy::Unrecognized{"Embedded requires a described schema type"};
      return strategy::Embedded{input.nestedSchema};
    case Marker::Methods:
      if (input.nestedSchema == 0)
        return strategy::Unrecognized{"Methods requires a described schema type"};
      return strategy::PerMethod{input.nestedSchema, cardinality, q.encoding.value_or(DefaultEncoding(cardinality)),
                                 q.tag, q.paramTags, q.matchName};
    case Marker::Parameters:
      if (input.nestedSchema == 0)
        return strategy::Unrecognized{"Parameters requires a described schema type"};
      return strategy::PerParameter{input.nestedSchema, cardinality, q.encoding.value_or(DefaultEncoding(cardinality)),
                                    q.tag, q.auxiliary, q.matchName};
    case Marker::Lookup:
      return strategy::ContextualLookup{input.lookupType, q.strict, q.bySubjectType};
    case Marker::Annotation:
      return strategy::CaptureAnnotation{q.annotationType, cardinality};
    case Marker::Name:
      return strategy::CaptureName{q.useExternalName};
    case Marker::Position:
      return strategy::CapturePosition{};
    case Marker::Flags:
      return strategy::CaptureFlags{};
    case Marker::Presence:
      return strategy::PresenceCheck{q.annotationType};
    }
    return strategy::Unrecognized{"unknown strategy qualifier"};
  }

} // namespace NGIN::Metadata
