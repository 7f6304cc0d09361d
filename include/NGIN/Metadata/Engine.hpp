// Engine.hpp
// Resolution primitives shared by the orchestrator: subjects, direct materialization, member mapping.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <NGIN/Metadata/Context.hpp>
#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/Interface.hpp>
#include <NGIN/Metadata/Plan.hpp>
#include <NGIN/Metadata/Types.hpp>
#include <NGIN/Metadata/Value.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace NGIN::Metadata
{

  struct DeriveOptions
  {
    // Report every real member that no schema parameter accepts. Auxiliary matches do not count.
    bool requireFullCoverage{false};
    // Stop collecting after this many diagnostics; 0 means unlimited.
    NGIN::UIntSize maxDiagnostics{0};
    // Resolve deferred contextual references before materializing typed results.
    bool finalize{true};
  };

  // The real declaration a schema is resolved against.
  struct NGIN_METADATA_API Subject
  {
    Scope scope{Scope::Interface};
    const InterfaceDecl *iface{nullptr};
    const MethodDecl *method{nullptr};
    const ParamDecl *param{nullptr};
    // Index among the parameters matched by the same schema parameter.
    NGIN::UInt32 indexInRaw{0};

    [[nodiscard]] static Subject Of(const InterfaceDecl &iface) noexcept;
    [[nodiscard]] static Subject Of(const InterfaceDecl &iface, const MethodDecl &method) noexcept;
    [[nodiscard]] static Subject Of(const InterfaceDecl &iface, const MethodDecl &method, const ParamDecl &param,
                                    NGIN::UInt32 indexInRaw) noexcept;

    [[nodiscard]] std::string_view Name() const noexcept;
    // ExternalName alias when declared, else Name().
    [[nodiscard]] std::string_view ExternalName() const noexcept;
    // Interface type, method result type or parameter type.
    [[nodiscard]] TypeRef Type() const noexcept;
    [[nodiscard]] DeclRef Ref() const noexcept;
    [[nodiscard]] AnnotationLevels Annotations() const;
  };

  namespace detail
  {
    class NGIN_METADATA_API DerivationContext
    {
    public:
      DerivationContext(const ContextResolver *resolver, const DeriveOptions &options) noexcept
          : m_resolver(resolver), m_options(&options)
      {
      }

      [[nodiscard]] const ContextResolver *Resolver() const noexcept { return m_resolver; }
      [[nodiscard]] const DeriveOptions &Options() const noexcept { return *m_options; }

    private:
      const ContextResolver *m_resolver{nullptr};
      const DeriveOptions *m_options{nullptr};
    };

    // Diagnostic attributed to schema parameter `param`.
    [[nodiscard]] NGIN_METADATA_API Diagnostic MakeDiagnostic(DiagnosticCode code, std::string message, const ParamPlan &param);

    // Value of a direct strategy (lookup, annotation, name, position, flags, presence) for `subject`.
    // Failures are appended to `out` and yield nullopt.
    [[nodiscard]] NGIN_METADATA_API std::optional<MetadataValue>
    MaterializeDirect(const ParamPlan &param, const Subject &subject, const DerivationContext &ctx, Diagnostics &out);

    // One assembled value per entry of plan.members, matched against the methods (interface scope)
    // or parameters (method scope) of `subject`. Entries that failed are Absent; failures go to `out`.
    [[nodiscard]] NGIN_METADATA_API NGIN::Containers::Vector<MetadataValue>
    MapMembers(const SchemaPlan &plan, const Subject &subject, const DerivationContext &ctx, Diagnostics &out);

    // Record of `plan` for `subject`. Independent failures are all collected into `out`.
    [[nodiscard]] NGIN_METADATA_API std::optional<MetadataValue>
    BuildRecord(const SchemaPlan &plan, const Subject &subject, const DerivationContext &ctx, Diagnostics &out);
  } // namespace detail

} // namespace NGIN::Metadata
