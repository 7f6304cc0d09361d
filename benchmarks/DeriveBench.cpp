#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <NGIN/Benchmark.hpp>
#include <NGIN/Metadata/Metadata.hpp>

using namespace NGIN;

namespace BenchDemo
{
  using namespace NGIN::Metadata;

  struct Exposed
  {
  };

  struct ArgMeta
  {
    std::string name;
    ParamPosition position;

    friend void NginMetadata(TypeTag<ArgMeta>, SchemaBuilder<ArgMeta> &b)
    {
      b.SetName("ArgMeta");
      b.Param<&ArgMeta::name>().Name();
      b.Param<&ArgMeta::position>().Position();
    }
  };

  struct CallMeta
  {
    std::string name;
    bool exposed{false};
    std::vector<ArgMeta> args;

    friend void NginMetadata(TypeTag<CallMeta>, SchemaBuilder<CallMeta> &b)
    {
      b.SetName("CallMeta");
      b.Param<&CallMeta::name>().Name(true);
      b.Param<&CallMeta::exposed>().Has<Exposed>();
      b.Param<&CallMeta::args>();
    }
  };

  struct ApiMeta
  {
    std::string name;
    std::map<std::string, CallMeta> calls;

    friend void NginMetadata(TypeTag<ApiMeta>, SchemaBuilder<ApiMeta> &b)
    {
      b.SetName("ApiMeta");
      b.Param<&ApiMeta::name>().Name();
      b.Param<&ApiMeta::calls>();
    }
  };

  InterfaceDecl MakeApi(int methods)
  {
    InterfaceBuilder b{"BenchDemo::Api"};
    for (int i = 0; i < methods; ++i)
    {
      auto m = b.Method("call" + std::to_string(i), TypeRef::Of<int>());
      m.Param("a", TypeRef::Of<int>()).Param("b", TypeRef::Of<std::string>());
      if (i % 2 == 0)
        m.Annotate(Annotation::Of<Exposed>());
    }
    return b.Build();
  }
}

int main()
{
  using namespace NGIN::Metadata;

  const auto small = BenchDemo::MakeApi(4);
  const auto large = BenchDemo::MakeApi(64);

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    UIntSize ok = 0;
    for (int i=0;i<1000;++i) {
      auto plan = CompileSchema<BenchDemo::ApiMeta>();
      ok += plan.has_value() ? 1 : 0;
    }
    ctx.doNotOptimize(ok);
    ctx.stop(); }, "CompileSchema ApiMeta 1k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Deriver deriver;
    ctx.start();
    UIntSize n = 0;
    for (int i=0;i<1000;++i) {
      auto v = deriver.Derive<BenchDemo::ApiMeta>(small);
      n += v.has_value() ? v->Field("calls")->AsMap().entries.Size() : 0;
    }
    ctx.doNotOptimize(n);
    ctx.stop(); }, "Derive cached plan, 4 methods 1k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    UIntSize n = 0;
    for (int i=0;i<1000;++i) {
      auto v = Derive<BenchDemo::ApiMeta>(small);
      n += v.has_value() ? v->Field("calls")->AsMap().entries.Size() : 0;
    }
    ctx.doNotOptimize(n);
    ctx.stop(); }, "Derive compile each time, 4 methods 1k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Deriver deriver;
    ctx.start();
    UIntSize n = 0;
    for (int i=0;i<100;++i) {
      auto v = deriver.Derive<BenchDemo::ApiMeta>(large);
      n += v.has_value() ? v->Field("calls")->AsMap().entries.Size() : 0;
    }
    ctx.doNotOptimize(n);
    ctx.stop(); }, "Derive cached plan, 64 methods 100");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Deriver deriver;
    ctx.start();
    UIntSize n = 0;
    for (int i=0;i<100;++i) {
      auto v = deriver.DeriveAs<BenchDemo::ApiMeta>(large);
      n += v.has_value() ? v->calls.size() : 0;
    }
    ctx.doNotOptimize(n);
    ctx.stop(); }, "DeriveAs typed, 64 methods 100");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
