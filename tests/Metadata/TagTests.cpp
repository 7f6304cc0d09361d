/// @file TagTests.cpp
/// @brief Annotation refinement, effective tags and tag restrictions.

#include <catch2/catch_test_macros.hpp>
#include <NGIN/Metadata/Metadata.hpp>

namespace TagDemo
{
  struct HttpMethod
  {
  };
  struct Get
  {
    using Base = HttpMethod;
  };
  struct CachedGet
  {
    using Base = Get;
  };
  struct Post
  {
    using Base = HttpMethod;
  };
  struct Unrelated
  {
  };
} // namespace TagDemo

TEST_CASE("RefinementFollowsTheBaseChain", "[metadata][Tags]")
{
  using namespace NGIN::Metadata;
  const auto root = EnsureAnnotationType<TagDemo::HttpMethod>();
  const auto get = EnsureAnnotationType<TagDemo::Get>();
  const auto cached = EnsureAnnotationType<TagDemo::CachedGet>();
  const auto post = EnsureAnnotationType<TagDemo::Post>();

  CHECK(IsRefinementOf(get, root));
  CHECK(IsRefinementOf(cached, root));
  CHECK(IsRefinementOf(cached, get));
  CHECK(IsRefinementOf(get, get));
  CHECK_FALSE(IsRefinementOf(root, get));
  CHECK_FALSE(IsRefinementOf(post, get));
  CHECK(AnnotationBase(cached) == get);
  CHECK(IsAnnotationType(post));
}

TEST_CASE("EffectiveTagPrefersOwnAnnotationsOverDefault", "[metadata][Tags]")
{
  using namespace NGIN::Metadata;
  const TagConfig config{EnsureAnnotationType<TagDemo::HttpMethod>(), EnsureAnnotationType<TagDemo::Get>()};

  InterfaceBuilder b{"Api"};
  b.Method("plain", TypeRef{});
  b.Method("posted", TypeRef{}).Annotate(Annotation::Of<TagDemo::Post>());
  b.Method("inherited", TypeRef{}).Overrides("Base::inherited").OverriddenAnnotate(Annotation::Of<TagDemo::CachedGet>());
  b.Method("other", TypeRef{}).Annotate(Annotation::Of<TagDemo::Unrelated>());
  const auto iface = b.Build();

  CHECK(EffectiveTag(AnnotationsOf(iface.methods[0]), config) == EnsureAnnotationType<TagDemo::Get>());
  CHECK(EffectiveTag(AnnotationsOf(iface.methods[1]), config) == EnsureAnnotationType<TagDemo::Post>());
  CHECK(EffectiveTag(AnnotationsOf(iface.methods[2]), config) == EnsureAnnotationType<TagDemo::CachedGet>());
  CHECK(EffectiveTag(AnnotationsOf(iface.methods[3]), config) == EnsureAnnotationType<TagDemo::Get>());

  const TagConfig noDefault{EnsureAnnotationType<TagDemo::HttpMethod>(), 0};
  CHECK(EffectiveTag(AnnotationsOf(iface.methods[0]), noDefault) == 0);
  CHECK(EffectiveTag(AnnotationsOf(iface.methods[1]), TagConfig{}) == 0);
}

TEST_CASE("AcceptsTagChecksRestrictionRefinement", "[metadata][Tags]")
{
  using namespace NGIN::Metadata;
  const auto get = EnsureAnnotationType<TagDemo::Get>();
  const auto cached = EnsureAnnotationType<TagDemo::CachedGet>();
  const auto post = EnsureAnnotationType<TagDemo::Post>();

  CHECK(AcceptsTag(0, 0));
  CHECK(AcceptsTag(0, post));
  CHECK(AcceptsTag(get, get));
  CHECK(AcceptsTag(get, cached));
  CHECK_FALSE(AcceptsTag(get, post));
  CHECK_FALSE(AcceptsTag(get, 0));
}

TEST_CASE("ExternalNameIsRegisteredWithTheAnnotationRegistry", "[metadata][Tags]")
{
  using namespace NGIN::Metadata;
  // Known without any prior EnsureAnnotationType call, so derivation only reads the registry.
  const auto id = ExternalNameType();
  CHECK(IsAnnotationType(id));
  CHECK(AnnotationTypeName(id) == detail::TypeNameOf<ExternalName>());
  CHECK(AnnotationBase(id) == 0);
  CHECK(EnsureAnnotationType<ExternalName>() == id);
  CHECK(MakeExternalName("alias").TypeId() == id);
}
