// Types.hpp
// Public-facing error codes, diagnostics and small identifier types
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <NGIN/Metadata/Export.hpp>

#include <source_location>
#include <string>
#include <string_view>
#include <expected>
#include <utility>

namespace NGIN::Metadata
{

  using Any = NGIN::Utilities::Any<>;
  using TypeId = NGIN::UInt64;
  using SchemaId = NGIN::UInt64;
  using AnnotationTypeId = NGIN::UInt64;

  // Which kind of real declaration a schema is being matched against.
  enum class Scope : NGIN::UInt8
  {
    Interface = 0,
    Method = 1,
    Parameter = 2,
  };

  [[nodiscard]] constexpr std::string_view ScopeName(Scope scope) noexcept
  {
    switch (scope)
    {
    case Scope::Interface:
      return "interface";
    case Scope::Method:
      return "method";
    case Scope::Parameter:
      return "parameter";
    }
    return "unknown";
  }

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    // Malformed schema; independent of any interface and always fatal.
    SchemaConfiguration = 3,
    // One or more matching failures against a specific interface.
    Matching = 4,
    // Deferred contextual references that could not be resolved at finalization.
    Unresolved = 5,
  };

  enum class DiagnosticCode : unsigned
  {
    None = 0,
    SchemaConfiguration = 1,
    NoMatch = 2,
    AmbiguousMatch = 3,
    DuplicateConsumption = 4,
    DuplicateName = 5,
    Cycle = 6,
    LookupFailure = 7,
  };

  [[nodiscard]] NGIN_METADATA_API std::string_view DiagnosticCodeName(DiagnosticCode code) noexcept;

  struct SourceLocation
  {
    std::string_view file{};
    NGIN::UInt32 line{0};
    NGIN::UInt32 column{0};

    constexpr SourceLocation() = default;
    constexpr SourceLocation(std::string_view f, NGIN::UInt32 l, NGIN::UInt32 c = 0) : file(f), line(l), column(c) {}

    [[nodiscard]] static constexpr SourceLocation From(const std::source_location &loc) noexcept
    {
      return SourceLocation{loc.file_name(), static_cast<NGIN::UInt32>(loc.line()), static_cast<NGIN::UInt32>(loc.column())};
    }
    [[nodiscard]] constexpr bool IsKnown() const noexcept { return !file.empty() && line != 0; }
  };

  // A real declaration named by a diagnostic.
  struct DeclRef
  {
    Scope scope{Scope::Method};
    std::string_view name{};
    SourceLocation location{};
  };

  struct Diagnostic
  {
    DiagnosticCode code{DiagnosticCode::None};
    std::string message{};
    // Owner chain of the schema parameter, e.g. "parameter `args` of schema GetMeta at parameter `gets` of schema RestMeta".
    std::string schemaPath{};
    SourceLocation schemaLocation{};
    NGIN::Containers::Vector<DeclRef> declarations{};
  };

  using Diagnostics = NGIN::Containers::Vector<Diagnostic>;

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string message{};
    Diagnostics diagnostics{};

    Error() = default;
    Error(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}
    Error(ErrorCode c, std::string m, Diagnostics d)
        : code(c), message(std::move(m)), diagnostics(std::move(d))
    {
    }

    [[nodiscard]] bool IsFatal() const noexcept { return code == ErrorCode::SchemaConfiguration; }
    [[nodiscard]] bool Has(DiagnosticCode c) const noexcept
    {
      for (NGIN::UIntSize i = 0; i < diagnostics.Size(); ++i)
        if (diagnostics[i].code == c)
          return true;
      return false;
    }
    [[nodiscard]] NGIN::UIntSize Count(DiagnosticCode c) const noexcept
    {
      NGIN::UIntSize n = 0;
      for (NGIN::UIntSize i = 0; i < diagnostics.Size(); ++i)
        if (diagnostics[i].code == c)
          ++n;
      return n;
    }

    // Multi-line rendering of every diagnostic, one block per failure.
    [[nodiscard]] NGIN_METADATA_API std::string Describe() const;
  };

  [[nodiscard]] NGIN_METADATA_API std::string FormatDiagnostic(const Diagnostic &diagnostic);

  template <class T>
  using Expected = std::expected<T, Error>;

} // namespace NGIN::Metadata
