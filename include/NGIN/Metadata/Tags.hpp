// Tags.hpp
// Effective tags of real declarations and tag restrictions of schema parameters.
#pragma once

#include <NGIN/Metadata/Annotations.hpp>
#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/Interface.hpp>
#include <NGIN/Metadata/Strategy.hpp>

namespace NGIN::Metadata
{

  // Tag of a declaration under `config`: the nearest annotation refining config.base,
  // else config.defaultTag, else 0 (no tag).
  [[nodiscard]] NGIN_METADATA_API AnnotationTypeId EffectiveTag(const AnnotationLevels &levels, const TagConfig &config) noexcept;

  // A restriction of 0 accepts everything; otherwise the tag must be the restriction or refine it.
  [[nodiscard]] NGIN_METADATA_API bool AcceptsTag(AnnotationTypeId restriction, AnnotationTypeId effectiveTag) noexcept;

} // namespace NGIN::Metadata
