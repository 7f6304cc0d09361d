/// @file SchemaValidationTests.cpp
/// @brief Schema configuration errors detected while compiling plans.

#include <catch2/catch_test_macros.hpp>
#include <NGIN/Metadata/Metadata.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ValidateDemo
{
  using namespace NGIN::Metadata;

  struct Doc
  {
  };
  struct HttpMethod
  {
  };
  struct Get
  {
    using Base = HttpMethod;
  };
  struct Unrelated
  {
  };

  struct Leaf
  {
    std::string name;

    friend void NginMetadata(TypeTag<Leaf>, SchemaBuilder<Leaf> &b)
    {
      b.SetName("Leaf");
      b.Param<&Leaf::name>().Name();
    }
  };

  struct PositionAtInterface
  {
    ParamPosition position;

    friend void NginMetadata(TypeTag<PositionAtInterface>, SchemaBuilder<PositionAtInterface> &b)
    {
      b.SetName("PositionAtInterface");
      b.Param<&PositionAtInterface::position>().Position();
    }
  };

  struct NameIntoBool
  {
    bool name{false};

    friend void NginMetadata(TypeTag<NameIntoBool>, SchemaBuilder<NameIntoBool> &b)
    {
      b.SetName("NameIntoBool");
      b.Param<&NameIntoBool::name>().Name();
    }
  };

  struct PositionalMethods
  {
    std::vector<Leaf> methods;

    friend void NginMetadata(TypeTag<PositionalMethods>, SchemaBuilder<PositionalMethods> &b)
    {
      b.SetName("PositionalMethods");
      b.Param<&PositionalMethods::methods>();
    }
  };

  struct NamedDocs
  {
    std::map<std::string, Annotation> docs;

    friend void NginMetadata(TypeTag<NamedDocs>, SchemaBuilder<NamedDocs> &b)
    {
      b.SetName("NamedDocs");
      b.Param<&NamedDocs::docs>().Annotation<Doc>();
    }
  };

  struct ShapeMismatch
  {
    std::optional<Leaf> leaf;

    friend void NginMetadata(TypeTag<ShapeMismatch>, SchemaBuilder<ShapeMismatch> &b)
    {
      b.SetName("ShapeMismatch");
      b.Param<&ShapeMismatch::leaf>().ExactlyOne();
    }
  };

  struct ConflictingMarkers
  {
    std::string name;

    friend void NginMetadata(TypeTag<ConflictingMarkers>, SchemaBuilder<ConflictingMarkers> &b)
    {
      b.SetName("ConflictingMarkers");
      b.Param<&ConflictingMarkers::name>().Name().Position();
    }
  };

  struct AuxiliaryMethods
  {
    std::optional<Leaf> leaf;

    friend void NginMetadata(TypeTag<AuxiliaryMethods>, SchemaBuilder<AuxiliaryMethods> &b)
    {
      b.SetName("AuxiliaryMethods");
      b.Param<&AuxiliaryMethods::leaf>().Auxiliary();
    }
  };

  struct CheckedName
  {
    std::string name;

    friend void NginMetadata(TypeTag<CheckedName>, SchemaBuilder<CheckedName> &b)
    {
      b.SetName("CheckedName");
      b.Param<&CheckedName::name>().Name().Checked();
    }
  };

  struct ForeignTag
  {
    std::optional<Leaf> leaf;

    friend void NginMetadata(TypeTag<ForeignTag>, SchemaBuilder<ForeignTag> &b)
    {
      b.SetName("ForeignTag");
      b.MethodTags<HttpMethod>();
      b.Param<&ForeignTag::leaf>().Tagged<Unrelated>();
    }
  };

  struct Untyped
  {
    int value{0};

    friend void NginMetadata(TypeTag<Untyped>, SchemaBuilder<Untyped> &b)
    {
      b.SetName("Untyped");
      b.Param<&Untyped::value>();
    }
  };

  struct UntypedList
  {
    std::vector<int> values;

    friend void NginMetadata(TypeTag<UntypedList>, SchemaBuilder<UntypedList> &b)
    {
      b.SetName("UntypedList");
      b.Param<&UntypedList::values>();
    }
  };

  struct NestedBad
  {
    std::map<std::string, PositionAtInterface> methods;

    friend void NginMetadata(TypeTag<NestedBad>, SchemaBuilder<NestedBad> &b)
    {
      b.SetName("NestedBad");
      b.Param<&NestedBad::methods>();
    }
  };

  template <class T>
  std::string ConfigurationProblem()
  {
    auto plan = CompileSchema<T>();
    if (plan)
      return {};
    if (plan.error().code != ErrorCode::SchemaConfiguration || plan.error().diagnostics.Size() != 1)
      return "<unexpected error shape>";
    if (plan.error().diagnostics[0].code != DiagnosticCode::SchemaConfiguration)
      return "<unexpected diagnostic>";
    return plan.error().diagnostics[0].message;
  }
} // namespace ValidateDemo

TEST_CASE("ValidSchemasCompile", "[metadata][Validation]")
{
  using namespace NGIN::Metadata;
  auto plan = CompileSchema<ValidateDemo::Leaf>();
  REQUIRE(plan.has_value());
  CHECK((*plan)->scope == Scope::Interface);
  REQUIRE((*plan)->params.Size() == 1);
  CHECK(std::holds_alternative<strategy::CaptureName>((*plan)->params[0].strategy));
}

TEST_CASE("StrategiesAreCheckedAgainstScopeAndValueType", "[metadata][Validation]")
{
  using namespace ValidateDemo;
  CHECK(ConfigurationProblem<PositionAtInterface>().find("parameter-scope") != std::string::npos);
  CHECK(ConfigurationProblem<NameIntoBool>().find("CaptureName requires a string member") != std::string::npos);
  CHECK(ConfigurationProblem<Untyped>().find("unrecognized strategy") != std::string::npos);
  CHECK(ConfigurationProblem<ConflictingMarkers>().find("conflicting") != std::string::npos);
}

TEST_CASE("ArityRestrictionsAreEnforced", "[metadata][Validation]")
{
  using namespace ValidateDemo;
  CHECK(ConfigurationProblem<PositionalMethods>().find("name-keyed") != std::string::npos);
  CHECK(ConfigurationProblem<NamedDocs>().find("name-keyed") != std::string::npos);
  CHECK(ConfigurationProblem<ShapeMismatch>().find("does not fit") != std::string::npos);
}

TEST_CASE("QualifiersOnlyApplyWhereMeaningful", "[metadata][Validation]")
{
  using namespace ValidateDemo;
  CHECK(ConfigurationProblem<AuxiliaryMethods>().find("Auxiliary") != std::string::npos);
  CHECK(ConfigurationProblem<CheckedName>().find("Checked") != std::string::npos);
  CHECK(ConfigurationProblem<ForeignTag>().find("does not refine") != std::string::npos);
}

TEST_CASE("NestedSchemaErrorsNameTheOwnerChain", "[metadata][Validation]")
{
  using namespace NGIN::Metadata;
  auto plan = CompileSchema<ValidateDemo::NestedBad>();
  REQUIRE_FALSE(plan.has_value());
  REQUIRE(plan.error().diagnostics.Size() == 1);
  CHECK(plan.error().diagnostics[0].schemaPath == "NestedBad::methods > PositionAtInterface::position");
  CHECK(plan.error().diagnostics[0].schemaLocation.IsKnown());

  // Configuration errors are fatal and take precedence over matching.
  InterfaceBuilder b{"ValidateDemo::Empty"};
  auto derived = Derive<ValidateDemo::NestedBad>(b.Build());
  REQUIRE_FALSE(derived.has_value());
  CHECK(derived.error().IsFatal());
}

TEST_CASE("UnknownSchemasAreNotFound", "[metadata][Validation]")
{
  using namespace NGIN::Metadata;
  auto plan = CompileSchema(0x1234u);
  REQUIRE_FALSE(plan.has_value());
  CHECK(plan.error().code == ErrorCode::NotFound);

  Deriver deriver;
  CHECK_FALSE(deriver.PlanFor(0x1234u).has_value());
  CHECK(deriver.CachedPlanCount() == 0);
}

TEST_CASE("UnsupportedMemberTypesRegisterButDoNotCompile", "[metadata][Validation]")
{
  using namespace NGIN::Metadata;
  const auto *desc = FindSchema(SchemaIdOf<ValidateDemo::Untyped>());
  REQUIRE(desc != nullptr);
  REQUIRE(desc->params.Size() == 1);
  CHECK(desc->params[0].element == ElementKind::Other);
  REQUIRE(desc->params[0].Store != nullptr);

  ValidateDemo::Untyped target{};
  auto stored = desc->params[0].Store(&target, MetadataValue::Bool(true));
  REQUIRE_FALSE(stored.has_value());
  CHECK(stored.error().code == ErrorCode::InvalidArgument);
  CHECK(target.value == 0);

  auto plan = CompileSchema<ValidateDemo::UntypedList>();
  REQUIRE_FALSE(plan.has_value());
  CHECK(plan.error().IsFatal());
  REQUIRE(plan.error().diagnostics.Size() == 1);
  CHECK(plan.error().diagnostics[0].schemaPath == "UntypedList::values");
  CHECK(plan.error().diagnostics[0].message.find("no applicable default") != std::string::npos);
}
