/// @file MemberMapperTests.cpp
/// @brief Matching of real methods and parameters onto member parameters.

#include <catch2/catch_test_macros.hpp>
#include <NGIN/Metadata/Metadata.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace MapperDemo
{
  using namespace NGIN::Metadata;

  struct ParamKind
  {
  };
  struct Query
  {
    using Base = ParamKind;
  };
  struct PathVar
  {
    using Base = ParamKind;
  };
  struct Body
  {
  };

  struct NameOnly
  {
    std::string name;

    friend void NginMetadata(TypeTag<NameOnly>, SchemaBuilder<NameOnly> &b)
    {
      b.SetName("NameOnly");
      b.Param<&NameOnly::name>().Name();
    }
  };

  // Two member parameters that accept the same methods.
  struct Greedy
  {
    std::optional<NameOnly> first;
    std::optional<NameOnly> second;

    friend void NginMetadata(TypeTag<Greedy>, SchemaBuilder<Greedy> &b)
    {
      b.SetName("Greedy");
      b.Param<&Greedy::first>();
      b.Param<&Greedy::second>();
    }
  };

  struct IntResult
  {
    std::string name;

    friend void NginMetadata(TypeTag<IntResult>, SchemaBuilder<IntResult> &b)
    {
      b.SetName("IntResult");
      b.RequireSubjectType<int>();
      b.Param<&IntResult::name>().Name();
    }
  };

  struct Counter
  {
    std::optional<IntResult> count;

    friend void NginMetadata(TypeTag<Counter>, SchemaBuilder<Counter> &b)
    {
      b.SetName("Counter");
      b.Param<&Counter::count>().MatchName("count");
    }
  };

  struct EncodedCounters
  {
    std::map<std::string, IntResult> all;

    friend void NginMetadata(TypeTag<EncodedCounters>, SchemaBuilder<EncodedCounters> &b)
    {
      b.SetName("EncodedCounters");
      b.Param<&EncodedCounters::all>();
    }
  };

  struct VerbatimCounters
  {
    std::map<std::string, IntResult> all;

    friend void NginMetadata(TypeTag<VerbatimCounters>, SchemaBuilder<VerbatimCounters> &b)
    {
      b.SetName("VerbatimCounters");
      b.Param<&VerbatimCounters::all>().Verbatim();
    }
  };

  struct ArgRef
  {
    std::string name;
    ParamPosition position;

    friend void NginMetadata(TypeTag<ArgRef>, SchemaBuilder<ArgRef> &b)
    {
      b.SetName("ArgRef");
      b.Param<&ArgRef::name>().Name();
      b.Param<&ArgRef::position>().Position();
    }
  };

  struct CreateMeta
  {
    std::vector<ArgRef> all;
    std::optional<ArgRef> body;

    friend void NginMetadata(TypeTag<CreateMeta>, SchemaBuilder<CreateMeta> &b)
    {
      b.SetName("CreateMeta");
      b.Param<&CreateMeta::all>().Auxiliary();
      b.Param<&CreateMeta::body>().Tagged<Body>();
    }
  };

  struct CreateApi
  {
    std::map<std::string, CreateMeta> methods;

    friend void NginMetadata(TypeTag<CreateApi>, SchemaBuilder<CreateApi> &b)
    {
      b.SetName("CreateApi");
      b.Param<&CreateApi::methods>();
    }
  };

  struct RouteMeta
  {
    std::vector<ArgRef> queries;
    std::vector<ArgRef> paths;

    friend void NginMetadata(TypeTag<RouteMeta>, SchemaBuilder<RouteMeta> &b)
    {
      b.SetName("RouteMeta");
      b.Param<&RouteMeta::queries>().Tagged<Query>();
      b.Param<&RouteMeta::paths>().Tagged<PathVar>();
    }
  };

  struct QueryDefault
  {
    std::map<std::string, RouteMeta> routes;

    friend void NginMetadata(TypeTag<QueryDefault>, SchemaBuilder<QueryDefault> &b)
    {
      b.SetName("QueryDefault");
      b.Param<&QueryDefault::routes>().ParamTags<ParamKind, Query>();
    }
  };

  struct PathDefault
  {
    std::map<std::string, RouteMeta> routes;

    friend void NginMetadata(TypeTag<PathDefault>, SchemaBuilder<PathDefault> &b)
    {
      b.SetName("PathDefault");
      b.Param<&PathDefault::routes>().ParamTags<ParamKind, PathVar>();
    }
  };

  // Body parameters are only observed; the one consuming parameter wants a query.
  struct AuxOnlyMeta
  {
    std::vector<ArgRef> seen;
    ArgRef value;

    friend void NginMetadata(TypeTag<AuxOnlyMeta>, SchemaBuilder<AuxOnlyMeta> &b)
    {
      b.SetName("AuxOnlyMeta");
      b.Param<&AuxOnlyMeta::seen>().Auxiliary().Tagged<Body>();
      b.Param<&AuxOnlyMeta::value>().Tagged<Query>();
    }
  };

  struct AuxOnlyApi
  {
    std::map<std::string, AuxOnlyMeta> methods;

    friend void NginMetadata(TypeTag<AuxOnlyApi>, SchemaBuilder<AuxOnlyApi> &b)
    {
      b.SetName("AuxOnlyApi");
      b.Param<&AuxOnlyApi::methods>();
    }
  };

  // Exactly one path variable and at most one query parameter.
  struct SingleRoute
  {
    ArgRef path;
    std::optional<ArgRef> query;

    friend void NginMetadata(TypeTag<SingleRoute>, SchemaBuilder<SingleRoute> &b)
    {
      b.SetName("SingleRoute");
      b.Param<&SingleRoute::path>().Tagged<PathVar>();
      b.Param<&SingleRoute::query>().Tagged<Query>();
    }
  };

  struct SingleByQuery
  {
    std::map<std::string, SingleRoute> routes;

    friend void NginMetadata(TypeTag<SingleByQuery>, SchemaBuilder<SingleByQuery> &b)
    {
      b.SetName("SingleByQuery");
      b.Param<&SingleByQuery::routes>().ParamTags<ParamKind, Query>();
    }
  };

  struct SingleByPath
  {
    std::map<std::string, SingleRoute> routes;

    friend void NginMetadata(TypeTag<SingleByPath>, SchemaBuilder<SingleByPath> &b)
    {
      b.SetName("SingleByPath");
      b.Param<&SingleByPath::routes>().ParamTags<ParamKind, PathVar>();
    }
  };

  InterfaceDecl MakeRoutes()
  {
    InterfaceBuilder b{"MapperDemo::Routes"};
    b.Method("lookup", TypeRef{})
        .Param("id", TypeRef::Of<int>())
        .ParamAnnotate(Annotation::Of<PathVar>())
        .Param("filter", TypeRef::Of<std::string>())
        .Param("page", TypeRef::Of<int>());
    return b.Build();
  }
} // namespace MapperDemo

TEST_CASE("MethodMatchedTwiceReportsDuplicateConsumption", "[metadata][MemberMapper]")
{
  using namespace NGIN::Metadata;
  InterfaceBuilder b{"MapperDemo::Ping"};
  b.Method("ping", TypeRef{});
  const auto iface = b.Build();

  auto r = Derive<MapperDemo::Greedy>(iface);
  REQUIRE_FALSE(r.has_value());
  // The two parameters fail only because of the double consumption.
  REQUIRE(r.error().diagnostics.Size() == 1);
  const auto &d = r.error().diagnostics[0];
  CHECK(d.code == DiagnosticCode::DuplicateConsumption);
  CHECK(d.message.find("Greedy::first") != std::string::npos);
  CHECK(d.message.find("Greedy::second") != std::string::npos);
  REQUIRE(d.declarations.Size() == 1);
  CHECK(d.declarations[0].name == std::string_view{"ping"});
}

TEST_CASE("VerbatimMatchesRequireTheSubjectType", "[metadata][MemberMapper]")
{
  using namespace NGIN::Metadata;

  InterfaceBuilder good{"MapperDemo::Good"};
  good.Method("count", TypeRef::Of<int>());
  good.Method("reset", TypeRef{});
  auto ok = Derive<MapperDemo::Counter>(good.Build());
  REQUIRE(ok.has_value());
  const auto *count = ok->Field("count");
  REQUIRE(count != nullptr);
  CHECK(count->Kind() == ValueKind::Record);

  InterfaceBuilder bad{"MapperDemo::Bad"};
  bad.Method("count", TypeRef::Of<std::string>());
  auto r = Derive<MapperDemo::Counter>(bad.Build());
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().diagnostics.Size() == 1);
  CHECK(r.error().diagnostics[0].code == DiagnosticCode::NoMatch);
  CHECK(r.error().diagnostics[0].message.find("requires") != std::string::npos);
  CHECK(r.error().diagnostics[0].schemaPath == "Counter::count");
}

TEST_CASE("EncodedMatchesIgnoreTheSubjectType", "[metadata][MemberMapper]")
{
  using namespace NGIN::Metadata;

  InterfaceBuilder b{"MapperDemo::Mixed"};
  b.Method("size", TypeRef::Of<std::string>());
  b.Method("total", TypeRef::Of<double>());
  const auto iface = b.Build();

  auto r = Derive<MapperDemo::EncodedCounters>(iface);
  REQUIRE(r.has_value());
  const auto *all = r->Field("all");
  REQUIRE(all != nullptr);
  CHECK(all->AsMap().entries.Size() == 2);

  auto verbatim = Derive<MapperDemo::VerbatimCounters>(iface);
  REQUIRE_FALSE(verbatim.has_value());
  CHECK(verbatim.error().Count(DiagnosticCode::NoMatch) == 2);
}

TEST_CASE("AuxiliaryParametersSeeConsumedParameters", "[metadata][MemberMapper]")
{
  using namespace NGIN::Metadata;
  InterfaceBuilder b{"MapperDemo::Create"};
  b.Method("create", TypeRef{})
      .Param("item", TypeRef::Of<std::string>())
      .ParamAnnotate(Annotation::Of<MapperDemo::Body>())
      .Param("count", TypeRef::Of<int>());
  const auto iface = b.Build();

  auto api = Deriver{}.DeriveAs<MapperDemo::CreateApi>(iface);
  REQUIRE(api.has_value());
  REQUIRE(api->methods.count("create") == 1);
  const auto &create = api->methods.at("create");
  REQUIRE(create.all.size() == 2);
  CHECK(create.all[0].name == "item");
  CHECK(create.all[0].position.indexInRaw == 0);
  CHECK(create.all[1].name == "count");
  CHECK(create.all[1].position.indexInRaw == 1);
  REQUIRE(create.body.has_value());
  CHECK(create.body->name == "item");

  // Auxiliary matches do not count as consumption.
  DeriveOptions strict{};
  strict.requireFullCoverage = true;
  auto r = Derive<MapperDemo::CreateApi>(iface, nullptr, strict);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().diagnostics.Size() == 1);
  CHECK(r.error().diagnostics[0].code == DiagnosticCode::NoMatch);
  CHECK(r.error().diagnostics[0].declarations[0].name == std::string_view{"count"});
}

TEST_CASE("ParamTagsDefaultDecidesUntaggedParameters", "[metadata][MemberMapper]")
{
  using namespace NGIN::Metadata;
  const auto iface = MapperDemo::MakeRoutes();

  Deriver deriver;
  auto byQuery = deriver.DeriveAs<MapperDemo::QueryDefault>(iface);
  REQUIRE(byQuery.has_value());
  const auto &q = byQuery->routes.at("lookup");
  REQUIRE(q.paths.size() == 1);
  CHECK(q.paths[0].name == "id");
  REQUIRE(q.queries.size() == 2);
  CHECK(q.queries[0].name == "filter");
  CHECK(q.queries[1].name == "page");
  CHECK(q.queries[1].position.index == 2);
  CHECK(q.queries[1].position.indexInRaw == 1);

  auto byPath = deriver.DeriveAs<MapperDemo::PathDefault>(iface);
  REQUIRE(byPath.has_value());
  const auto &p = byPath->routes.at("lookup");
  CHECK(p.queries.empty());
  REQUIRE(p.paths.size() == 3);
  CHECK(p.paths[2].position.indexInRaw == 2);
}

TEST_CASE("MapMembersReturnsOneValuePerMemberParameter", "[metadata][MemberMapper]")
{
  using namespace NGIN::Metadata;
  const auto iface = MapperDemo::MakeRoutes();

  auto plan = CompileSchema<MapperDemo::RouteMeta>(Scope::Method);
  REQUIRE(plan.has_value());
  REQUIRE((*plan)->members.Size() == 2);

  const DeriveOptions options{};
  const detail::DerivationContext ctx{nullptr, options};
  Diagnostics diags;
  auto values = detail::MapMembers(**plan, Subject::Of(iface, iface.methods[0]), ctx, diags);
  CHECK(diags.Size() == 0);
  REQUIRE(values.Size() == 2);
  // Without a tag configuration only explicitly tagged parameters are matched.
  CHECK(values[0].AsList().items.Size() == 0);
  CHECK(values[1].AsList().items.Size() == 1);
}

TEST_CASE("AuxiliaryOnlyMatchLeavesConsumingParameterUnmatched", "[metadata][MemberMapper]")
{
  using namespace NGIN::Metadata;
  InterfaceBuilder b{"MapperDemo::Store"};
  b.Method("store", TypeRef{})
      .Param("item", TypeRef::Of<std::string>())
      .ParamAnnotate(Annotation::Of<MapperDemo::Body>());
  const auto iface = b.Build();

  auto plan = CompileSchema<MapperDemo::AuxOnlyMeta>(Scope::Method);
  REQUIRE(plan.has_value());

  const DeriveOptions options{};
  const detail::DerivationContext ctx{nullptr, options};
  Diagnostics diags;
  auto values = detail::MapMembers(**plan, Subject::Of(iface, iface.methods[0]), ctx, diags);
  REQUIRE(values.Size() == 2);
  // The auxiliary parameter still records the member it saw.
  REQUIRE(values[0].AsList().items.Size() == 1);
  CHECK(values[1].IsAbsent());
  REQUIRE(diags.Size() == 1);
  CHECK(diags[0].code == DiagnosticCode::NoMatch);
  CHECK(diags[0].schemaPath == "AuxOnlyMeta::value");
  REQUIRE(diags[0].declarations.Size() == 1);
  CHECK(diags[0].declarations[0].name == std::string_view{"store"});

  auto r = Derive<MapperDemo::AuxOnlyApi>(iface);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().diagnostics.Size() == 1);
  CHECK(r.error().diagnostics[0].code == DiagnosticCode::NoMatch);
  CHECK(r.error().diagnostics[0].schemaPath == "AuxOnlyApi::methods > AuxOnlyMeta::value");
}

TEST_CASE("ParamTagsDefaultFeedsSingleValuedParameters", "[metadata][MemberMapper]")
{
  using namespace NGIN::Metadata;
  InterfaceBuilder b{"MapperDemo::Single"};
  b.Method("get", TypeRef{}).Param("id", TypeRef::Of<int>());
  b.Method("find", TypeRef{})
      .Param("id", TypeRef::Of<int>())
      .ParamAnnotate(Annotation::Of<MapperDemo::PathVar>())
      .Param("sort", TypeRef::Of<std::string>());
  const auto iface = b.Build();

  Deriver deriver;
  // The untagged parameter of `get` becomes the path variable.
  auto byPath = deriver.DeriveAs<MapperDemo::SingleByPath>(iface);
  REQUIRE_FALSE(byPath.has_value());
  // `find` now has two path variables where exactly one is allowed.
  REQUIRE(byPath.error().diagnostics.Size() == 1);
  CHECK(byPath.error().diagnostics[0].code == DiagnosticCode::AmbiguousMatch);
  CHECK(byPath.error().diagnostics[0].schemaPath == "SingleByPath::routes > SingleRoute::path");
  REQUIRE(byPath.error().diagnostics[0].declarations.Size() == 2);
  CHECK(byPath.error().diagnostics[0].declarations[1].name == std::string_view{"sort"});

  // Untagged parameters default to the query, which leaves `get` without a path variable.
  auto byQuery = deriver.DeriveAs<MapperDemo::SingleByQuery>(iface);
  REQUIRE_FALSE(byQuery.has_value());
  REQUIRE(byQuery.error().diagnostics.Size() == 1);
  CHECK(byQuery.error().diagnostics[0].code == DiagnosticCode::NoMatch);
  CHECK(byQuery.error().diagnostics[0].schemaPath == "SingleByQuery::routes > SingleRoute::path");
  REQUIRE(byQuery.error().diagnostics[0].declarations.Size() == 1);
  CHECK(byQuery.error().diagnostics[0].declarations[0].name == std::string_view{"get"});

  InterfaceBuilder single{"MapperDemo::Lookup"};
  single.Method("find", TypeRef{})
      .Param("id", TypeRef::Of<int>())
      .ParamAnnotate(Annotation::Of<MapperDemo::PathVar>())
      .Param("sort", TypeRef::Of<std::string>());
  auto ok = deriver.DeriveAs<MapperDemo::SingleByQuery>(single.Build());
  REQUIRE(ok.has_value());
  const auto &find = ok->routes.at("find");
  CHECK(find.path.name == "id");
  REQUIRE(find.query.has_value());
  CHECK(find.query->name == "sort");
  CHECK(find.query->position.index == 1);
}
