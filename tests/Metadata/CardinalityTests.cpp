/// @file CardinalityTests.cpp
/// @brief Exactly-one, zero-or-one and many resolution over candidate sets.

#include <catch2/catch_test_macros.hpp>
#include <NGIN/Metadata/Cardinality.hpp>

namespace
{
  NGIN::Containers::Vector<NGIN::Metadata::Candidate> Candidates(std::initializer_list<std::string_view> names)
  {
    NGIN::Containers::Vector<NGIN::Metadata::Candidate> out;
    NGIN::UInt32 i = 0;
    for (auto n : names)
      out.PushBack(NGIN::Metadata::Candidate{n, i++});
    return out;
  }
} // namespace

TEST_CASE("ExactlyOneRequiresASingleCandidate", "[metadata][Cardinality]")
{
  using namespace NGIN::Metadata;
  const Cardinality c{ExactlyOne{}};

  auto none = ResolveCardinality(c, Candidates({}));
  REQUIRE_FALSE(none.has_value());
  CHECK(none.error().code == DiagnosticCode::NoMatch);
  CHECK(none.error().offending.Size() == 0);

  auto one = ResolveCardinality(c, Candidates({"a"}));
  REQUIRE(one.has_value());
  REQUIRE(one->Size() == 1);
  CHECK((*one)[0] == 0);

  auto two = ResolveCardinality(c, Candidates({"a", "b"}));
  REQUIRE_FALSE(two.has_value());
  CHECK(two.error().code == DiagnosticCode::AmbiguousMatch);
  CHECK(two.error().offending.Size() == 2);
}

TEST_CASE("ZeroOrOneAcceptsAnEmptySet", "[metadata][Cardinality]")
{
  using namespace NGIN::Metadata;
  const Cardinality c{ZeroOrOne{}};

  auto none = ResolveCardinality(c, Candidates({}));
  REQUIRE(none.has_value());
  CHECK(none->Size() == 0);

  auto three = ResolveCardinality(c, Candidates({"a", "b", "c"}));
  REQUIRE_FALSE(three.has_value());
  CHECK(three.error().code == DiagnosticCode::AmbiguousMatch);
  CHECK(three.error().offending.Size() == 3);
}

TEST_CASE("ManyPositionalKeepsDeclarationOrder", "[metadata][Cardinality]")
{
  using namespace NGIN::Metadata;
  auto r = ResolveCardinality(Cardinality{Many{}}, Candidates({"x", "x", "y"}));
  REQUIRE(r.has_value());
  REQUIRE(r->Size() == 3);
  CHECK((*r)[0] == 0);
  CHECK((*r)[1] == 1);
  CHECK((*r)[2] == 2);

  auto empty = ResolveCardinality(Cardinality{Many{}}, Candidates({}));
  REQUIRE(empty.has_value());
  CHECK(empty->Size() == 0);
}

TEST_CASE("ManyNamedReportsEveryCollidingCandidate", "[metadata][Cardinality]")
{
  using namespace NGIN::Metadata;
  const Cardinality c{Many{Naming::Named}};

  auto ok = ResolveCardinality(c, Candidates({"get", "put"}));
  REQUIRE(ok.has_value());
  CHECK(ok->Size() == 2);

  auto clash = ResolveCardinality(c, Candidates({"get", "put", "get", "del", "put"}));
  REQUIRE_FALSE(clash.has_value());
  CHECK(clash.error().code == DiagnosticCode::DuplicateName);
  REQUIRE(clash.error().offending.Size() == 4);
  CHECK(clash.error().offending[0] == 0);
  CHECK(clash.error().offending[1] == 1);
  CHECK(clash.error().offending[2] == 2);
  CHECK(clash.error().offending[3] == 4);
}
