// Strategy.hpp
// Derivation strategies, cardinalities and the qualifiers attached to schema parameters.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/Interface.hpp>
#include <NGIN/Metadata/Types.hpp>

#include <optional>
#include <string_view>
#include <variant>

namespace NGIN::Metadata
{

  enum class Naming : NGIN::UInt8
  {
    Positional = 0,
    Named = 1,
  };

  struct ExactlyOne
  {
  };
  struct ZeroOrOne
  {
  };
  struct Many
  {
    Naming naming{Naming::Positional};
  };

  using Cardinality = std::variant<ExactlyOne, ZeroOrOne, Many>;

  [[nodiscard]] NGIN_METADATA_API std::string_view CardinalityName(const Cardinality &c) noexcept;
  [[nodiscard]] inline bool IsMany(const Cardinality &c) noexcept { return std::holds_alternative<Many>(c); }
  [[nodiscard]] inline bool IsNamedMany(const Cardinality &c) noexcept
  {
    const auto *m = std::get_if<Many>(&c);
    return m && m->naming == Naming::Named;
  }

  // Whether a matched method/parameter must agree with the nested schema's subject type.
  enum class Encoding : NGIN::UInt8
  {
    Verbatim = 0,
    Encoded = 1,
  };

  // Tag configuration of one member kind: the tag base and the tag assumed for untagged members.
  struct TagConfig
  {
    AnnotationTypeId base{0};
    AnnotationTypeId defaultTag{0};

    [[nodiscard]] constexpr bool IsSet() const noexcept { return base != 0; }
  };

  namespace strategy
  {
    struct ContextualLookup
    {
      TypeRef requested{};
      bool strict{false};
      bool bySubjectType{false};
    };
    struct CaptureAnnotation
    {
      AnnotationTypeId type{0};
      Cardinality cardinality{};
    };
    struct CaptureName
    {
      bool useExternalName{false};
    };
    struct CapturePosition
    {
    };
    struct CaptureFlags
    {
    };
    struct PresenceCheck
    {
      AnnotationTypeId type{0};
    };
    struct Embedded
    {
      SchemaId schema{0};
    };
    struct PerMethod
    {
      SchemaId schema{0};
      Cardinality cardinality{};
      Encoding encoding{Encoding::Verbatim};
      AnnotationTypeId tag{0};
      TagConfig paramTags{};
      std::string_view matchName{};
    };
    struct PerParameter
    {
      SchemaId schema{0};
      Cardinality cardinality{};
      Encoding encoding{Encoding::Verbatim};
      AnnotationTypeId tag{0};
      bool auxiliary{false};
      std::string_view matchName{};
    };
    struct Unrecognized
    {
      std::string_view reason{};
    };
  } // namespace strategy

  using Strategy = std::variant<strategy::ContextualLookup, strategy::CaptureAnnotation, strategy::CaptureName,
                                strategy::CapturePosition, strategy::CaptureFlags, strategy::PresenceCheck,
                                strategy::Embedded, strategy::PerMethod, strategy::PerParameter,
                                strategy::Unrecognized>;

  [[nodiscard]] NGIN_METADATA_API std::string_view StrategyName(const Strategy &s) noexcept;

  // Explicit strategy markers a schema parameter may carry.
  enum class Marker : NGIN::UInt8
  {
    Embedded,
    Methods,
    Parameters,
    Lookup,
    Annotation,
    Name,
    Position,
    Flags,
    Presence,
  };

  [[nodiscard]] NGIN_METADATA_API std::string_view MarkerName(Marker m) noexcept;

  // Raw qualifiers as written on a schema parameter, before classification.
  struct Qualifiers
  {
    NGIN::Containers::Vector<Marker> markers{};
    std::optional<Cardinality> cardinality{};
    std::optional<Encoding> encoding{};
    AnnotationTypeId annotationType{0};
    AnnotationTypeId tag{0};
    TagConfig paramTags{};
    std::string_view matchName{};
    bool strict{false};
    bool bySubjectType{false};
    bool useExternalName{false};
    bool auxiliary{false};

    [[nodiscard]] bool HasMarker(Marker m) const noexcept
    {
      for (NGIN::UIntSize i = 0; i < markers.Size(); ++i)
        if (markers[i] == m)
          return true;
      return false;
    }
  };

  // What a schema parameter's member type contributes to classification.
  struct ClassifyInput
  {
    Scope scope{Scope::Interface};
    const Qualifiers *qualifiers{nullptr};
    // Member is a ContextRef<X>; `lookupType` is X.
    bool contextual{false};
    TypeRef lookupType{};
    // Described schema held by the member, 0 when the member does not hold one.
    SchemaId nestedSchema{0};
    // Cardinality implied by the member's container shape.
    Cardinality shapeCardinality{};
  };

  // Precedence: Embedded marker, then an explicit direct strategy, then the contextual default,
  // then the scope default (PerMethod at interface scope, PerParameter at method scope).
  // Conflicting markers and parameters with nothing to go on classify as Unrecognized.
  [[nodiscard]] NGIN_METADATA_API Strategy Classify(const ClassifyInput &input);

} // namespace NGIN::Metadata
