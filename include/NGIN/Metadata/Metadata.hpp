// Metadata.hpp
// Public umbrella header for NGIN.Metadata
#pragma once

#include <string_view>

#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/Types.hpp>
#include <NGIN/Metadata/Annotations.hpp>
#include <NGIN/Metadata/Interface.hpp>
#include <NGIN/Metadata/Value.hpp>
#include <NGIN/Metadata/Context.hpp>
#include <NGIN/Metadata/Strategy.hpp>
#include <NGIN/Metadata/Cardinality.hpp>
#include <NGIN/Metadata/Tags.hpp>
#include <NGIN/Metadata/Registry.hpp>
#include <NGIN/Metadata/Convert.hpp>
#include <NGIN/Metadata/SchemaBuilder.hpp>
#include <NGIN/Metadata/Plan.hpp>
#include <NGIN/Metadata/Engine.hpp>
#include <NGIN/Metadata/Deriver.hpp>

namespace NGIN::Metadata
{
  // For quick sanity checks / examples.
  [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.Metadata"; }
} // namespace NGIN::Metadata
