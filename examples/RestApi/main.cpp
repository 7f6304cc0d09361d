#include <NGIN/Metadata/Metadata.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace RestApi
{
  using namespace NGIN::Metadata;

  // Annotation vocabulary of the service.
  struct Verb
  {
  };
  struct Get
  {
    using Base = Verb;
  };
  struct Post
  {
    using Base = Verb;
  };
  struct Source
  {
  };
  struct Query
  {
    using Base = Source;
  };
  struct Path
  {
    using Base = Source;
  };
  struct Body
  {
    using Base = Source;
  };
  struct Summary
  {
  };

  struct Serializer
  {
    std::string mediaType;
  };

  struct ArgMeta
  {
    std::string name;
    ParamPosition position;
    ParamFlags flags;

    friend void NginMetadata(TypeTag<ArgMeta>, SchemaBuilder<ArgMeta> &b)
    {
      b.SetName("ArgMeta");
      b.Param<&ArgMeta::name>().Name(true);
      b.Param<&ArgMeta::position>().Position();
      b.Param<&ArgMeta::flags>().Flags();
    }
  };

  struct EndpointMeta
  {
    std::string name;
    std::optional<Annotation> summary;
    std::vector<ArgMeta> path;
    std::vector<ArgMeta> query;
    std::optional<ArgMeta> body;
    ContextRef<Serializer> serializer;

    friend void NginMetadata(TypeTag<EndpointMeta>, SchemaBuilder<EndpointMeta> &b)
    {
      b.SetName("EndpointMeta");
      b.ParamTags<Source, Query>();
      b.Param<&EndpointMeta::name>().Name(true);
      b.Param<&EndpointMeta::summary>().Annotation<Summary>();
      b.Param<&EndpointMeta::path>().Tagged<Path>();
      b.Param<&EndpointMeta::query>().Tagged<Query>();
      b.Param<&EndpointMeta::body>().Tagged<Body>();
      b.Param<&EndpointMeta::serializer>().ForSubjectType();
    }
  };

  struct ServiceMeta
  {
    std::string name;
    std::map<std::string, EndpointMeta> gets;
    std::map<std::string, EndpointMeta> posts;

    friend void NginMetadata(TypeTag<ServiceMeta>, SchemaBuilder<ServiceMeta> &b)
    {
      b.SetName("ServiceMeta");
      b.MethodTags<Verb>();
      b.Param<&ServiceMeta::name>().Name();
      b.Param<&ServiceMeta::gets>().Tagged<Get>();
      b.Param<&ServiceMeta::posts>().Tagged<Post>();
    }
  };

  struct Order
  {
  };

  struct Orders
  {
    Order find(int, bool) { return Order{}; }
    Order create(const Order &order) { return order; }
    std::string status() { return "ok"; }
  };

  InterfaceDecl Describe()
  {
    auto b = InterfaceBuilder::For<Orders>();
    // Spelled out by hand so the path parameter can carry its own annotation.
    b.Method("find", TypeRef::Of<Order>())
        .Annotate(Annotation::Of<Get>())
        .Annotate(Annotation::Of<Summary>().With("text", AttrValue{std::in_place_type<std::string_view>, "Fetch one order"}))
        .Annotate(MakeExternalName("order"))
        .Param("id", TypeRef::Of<int>())
        .ParamAnnotate(Annotation::Of<Path>())
        .Param("expand", TypeRef::Of<bool>());
    b.Method<&Orders::create>("create", {"order"})
        .Annotate(Annotation::Of<Post>())
        .ParamAnnotate(Annotation::Of<Body>());
    b.Method<&Orders::status>("status").Annotate(Annotation::Of<Get>());
    return b.Build();
  }
} // namespace RestApi

int main()
{
  using namespace NGIN::Metadata;
  spdlog::set_level(spdlog::level::debug);
  spdlog::info("{} REST example", LibraryName());

  const auto api = RestApi::Describe();

  ContextRegistry context;
  context.Register<RestApi::Serializer>(RestApi::Serializer{"application/json"});
  context.RegisterFor<RestApi::Serializer>(TypeRef::Of<std::string>(), RestApi::Serializer{"text/plain"});

  Deriver deriver;
  auto service = deriver.DeriveAs<RestApi::ServiceMeta>(api, &context);
  if (!service)
  {
    spdlog::error("{}", service.error().message);
    spdlog::error("{}", service.error().Describe());
  }
  else
  {
    spdlog::info("service {}", service->name);
    for (const auto &[route, endpoint] : service->gets)
    {
      const auto summary = endpoint.summary ? endpoint.summary->FindString("text") : std::nullopt;
      spdlog::info("  GET  {:<8} -> {} [{}] {}", route, endpoint.name, endpoint.serializer.Value().mediaType,
                   summary.value_or(""));
      for (const auto &arg : endpoint.path)
        spdlog::info("         path  {} #{}", arg.name, arg.position.index);
      for (const auto &arg : endpoint.query)
        spdlog::info("         query {} #{}", arg.name, arg.position.index);
    }
    for (const auto &[route, endpoint] : service->posts)
    {
      spdlog::info("  POST {:<8} -> {} [{}]", route, endpoint.name, endpoint.serializer.Value().mediaType);
      if (endpoint.body)
        spdlog::info("         body  {}{}", endpoint.body->name, endpoint.body->flags.IsByReference() ? " (by reference)" : "");
    }
  }

  // The same schema against an interface with two GET methods claiming one route.
  InterfaceBuilder broken{"RestApi::Broken"};
  broken.Method("list", TypeRef::Of<std::string>()).Annotate(Annotation::Of<RestApi::Get>());
  broken.Method("listAll", TypeRef::Of<std::string>())
      .Annotate(Annotation::Of<RestApi::Get>())
      .Annotate(MakeExternalName("list"));
  broken.Method("submit", TypeRef{})
      .Annotate(Annotation::Of<RestApi::Post>())
      .Param("a", TypeRef::Of<int>())
      .ParamAnnotate(Annotation::Of<RestApi::Body>())
      .Param("b", TypeRef::Of<int>())
      .ParamAnnotate(Annotation::Of<RestApi::Body>());

  auto failed = deriver.DeriveAs<RestApi::ServiceMeta>(broken.Build(), &context);
  if (!failed)
  {
    spdlog::warn("{}", failed.error().message);
    for (NGIN::UIntSize i = 0; i < failed.error().diagnostics.Size(); ++i)
      fmt::print("{}\n", FormatDiagnostic(failed.error().diagnostics[i]));
  }
  spdlog::info("cached plans: {}", deriver.CachedPlanCount());
  return 0;
}
