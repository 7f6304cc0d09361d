#include <NGIN/Metadata/Tags.hpp>

namespace NGIN::Metadata
{

  AnnotationTypeId EffectiveTag(const AnnotationLevels &levels, const TagConfig &config) noexcept
  {
    if (!config.IsSet())
      return 0;
    if (const auto *a = levels.FindFirst(config.base))
      return a->TypeId();
    return config.defaultTag;
  }

  bool AcceptsTag(AnnotationTypeId restriction, AnnotationTypeId effectiveTag) noexcept
  {
    if (restriction == 0)
      return true;
    if (effectiveTag == 0)
      return false;
    return IsRefinementOf(effectiveTag, restriction);
  }

} // namespace NGIN::Metadata
