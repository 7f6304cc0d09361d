/// @file BasicTests.cpp
/// @brief Smoke tests for NGIN.Metadata: library identity, schema registration, value trees.

#include <catch2/catch_test_macros.hpp>
#include <NGIN/Metadata/Metadata.hpp>

#include <string>

namespace BasicDemo
{
  struct Flagged
  {
  };

  struct NameMeta
  {
    std::string name;
    bool marked{false};

    friend void NginMetadata(NGIN::Metadata::TypeTag<NameMeta>, NGIN::Metadata::SchemaBuilder<NameMeta> &b)
    {
      b.SetName("NameMeta");
      b.Param<&NameMeta::name>().Name();
      b.Param<&NameMeta::marked>().Has<Flagged>();
    }
  };

  struct Undescribed
  {
    int x{0};
  };
} // namespace BasicDemo

namespace NGIN::Metadata
{
  template <>
  struct DescribeSchema<BasicDemo::Undescribed>
  {
    static void Do(SchemaBuilder<BasicDemo::Undescribed> &b) { b.SetName("ExternallyDescribed"); }
  };
} // namespace NGIN::Metadata

TEST_CASE("LibraryNameReturnsModuleIdentifier", "[metadata][Basics]")
{
  CHECK(NGIN::Metadata::LibraryName() == std::string_view{"NGIN.Metadata"});
}

TEST_CASE("SchemaRegistrationRecordsParameters", "[metadata][Basics]")
{
  using namespace NGIN::Metadata;
  const auto id = SchemaIdOf<BasicDemo::NameMeta>();
  const auto *desc = FindSchema(id);
  REQUIRE(desc != nullptr);
  CHECK(desc->name == std::string_view{"NameMeta"});
  REQUIRE(desc->params.Size() == 2);
  CHECK(desc->params[0].name == std::string_view{"name"});
  CHECK(desc->params[0].element == ElementKind::String);
  CHECK(desc->params[1].name == std::string_view{"marked"});
  CHECK(desc->params[1].element == ElementKind::Bool);
  CHECK(desc->params[1].qualifiers.HasMarker(Marker::Presence));

  // Registration is idempotent.
  const auto count = SchemaCount();
  CHECK(SchemaIdOf<BasicDemo::NameMeta>() == id);
  CHECK(SchemaCount() == count);
}

TEST_CASE("DescribeSchemaTraitIsUsedWithoutAdlHook", "[metadata][Basics]")
{
  using namespace NGIN::Metadata;
  const auto *desc = FindSchema(SchemaIdOf<BasicDemo::Undescribed>());
  REQUIRE(desc != nullptr);
  CHECK(desc->name == std::string_view{"ExternallyDescribed"});
  CHECK(desc->params.Size() == 0);
}

TEST_CASE("MetadataValueEqualityIsStructural", "[metadata][Basics]")
{
  using namespace NGIN::Metadata;

  ListValue a;
  a.items.PushBack(MetadataValue::String("x"));
  a.items.PushBack(MetadataValue::Bool(true));
  ListValue b;
  b.items.PushBack(MetadataValue::String("x"));
  b.items.PushBack(MetadataValue::Bool(true));
  CHECK(MetadataValue::List(a) == MetadataValue::List(b));

  b.items.PushBack(MetadataValue::Absent());
  CHECK_FALSE(MetadataValue::List(a) == MetadataValue::List(b));

  MapValue m;
  m.entries.PushBack(MapEntry{"first", MetadataValue::String("1")});
  const auto mv = MetadataValue::Map(m);
  REQUIRE(mv.AsMap().Find("first") != nullptr);
  CHECK(mv.AsMap().Find("first")->AsString() == "1");
  CHECK(mv.AsMap().Find("second") == nullptr);
  CHECK(MetadataValue::Absent().IsAbsent());
  CHECK(ValueKindName(ValueKind::Record) == std::string_view{"record"});
}

TEST_CASE("MaterializeRejectsForeignRecords", "[metadata][Basics]")
{
  using namespace NGIN::Metadata;

  RecordValue rec{};
  rec.schema = SchemaIdOf<BasicDemo::Undescribed>();
  rec.schemaName = "ExternallyDescribed";
  auto r = Materialize<BasicDemo::NameMeta>(MetadataValue::Record(rec));
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::InvalidArgument);

  auto wrongKind = Materialize<BasicDemo::NameMeta>(MetadataValue::String("x"));
  REQUIRE_FALSE(wrongKind.has_value());
  CHECK(wrongKind.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("MaterializeStoresFieldsInOrder", "[metadata][Basics]")
{
  using namespace NGIN::Metadata;

  RecordValue rec{};
  rec.schema = SchemaIdOf<BasicDemo::NameMeta>();
  rec.schemaName = "NameMeta";
  rec.fields.PushBack(RecordField{"name", MetadataValue::String("ping")});
  rec.fields.PushBack(RecordField{"marked", MetadataValue::Bool(true)});
  auto r = Materialize<BasicDemo::NameMeta>(MetadataValue::Record(rec));
  REQUIRE(r.has_value());
  CHECK(r->name == "ping");
  CHECK(r->marked);

  RecordValue bad = rec;
  bad.fields[1].value = MetadataValue::String("oops");
  auto e = Materialize<BasicDemo::NameMeta>(MetadataValue::Record(bad));
  REQUIRE_FALSE(e.has_value());
  CHECK(e.error().message.rfind("marked: ", 0) == 0);
}
