#include <NGIN/Metadata/Types.hpp>
#include <NGIN/Metadata/Engine.hpp>

#include <fmt/format.h>

namespace NGIN::Metadata
{

  std::string_view DiagnosticCodeName(DiagnosticCode code) noexcept
  {
    switch (code)
    {
    case DiagnosticCode::None:
      return "None";
    case DiagnosticCode::SchemaConfiguration:
      return "SchemaConfiguration";
    case DiagnosticCode::NoMatch:
      return "NoMatch";
    case DiagnosticCode::AmbiguousMatch:
      return "AmbiguousMatch";
    case DiagnosticCode::DuplicateConsumption:
      return "DuplicateConsumption";
    case DiagnosticCode::DuplicateName:
      return "DuplicateName";
    case DiagnosticCode::Cycle:
      return "Cycle";
    case DiagnosticCode::LookupFailure:
      return "LookupFailure";
    }
    return "Unknown";
  }

  namespace
  {
    void AppendLocation(std::string &out, const SourceLocation &loc)
    {
      if (loc.IsKnown())
        out += fmt::format(" ({}:{})", loc.file, loc.line);
    }
  } // namespace

  std::string FormatDiagnostic(const Diagnostic &diagnostic)
  {
    std::string out = fmt::format("error[{}]: {}", DiagnosticCodeName(diagnostic.code), diagnostic.message);
    if (!diagnostic.schemaPath.empty())
    {
      out += fmt::format("\n  schema parameter: {}", diagnostic.schemaPath);
      AppendLocation(out, diagnostic.schemaLocation);
    }
    for (NGIN::UIntSize i = 0; i < diagnostic.declarations.Size(); ++i)
    {
      const auto &decl = diagnostic.declarations[i];
      out += fmt::format("\n  {} `{}`", ScopeName(decl.scope), decl.name);
      AppendLocation(out, decl.location);
    }
    return out;
  }

  std::string Error::Describe() const
  {
    std::string out = message;
    for (NGIN::UIntSize i = 0; i < diagnostics.Size(); ++i)
    {
      out += '\n';
      out += FormatDiagnostic(diagnostics[i]);
    }
    return out;
  }

} // namespace NGIN::Metadata

namespace NGIN::Metadata::detail
{

  Diagnostic MakeDiagnostic(DiagnosticCode code, std::string message, const ParamPlan &param)
  {
    Diagnostic d{};
    d.code = code;
    d.message = std::move(message);
    d.schemaPath = param.path;
    d.schemaLocation = param.location;
    return d;
  }

} // namespace NGIN::Metadata::detail
