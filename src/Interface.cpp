#include <NGIN/Metadata/Interface.hpp>
#include <NGIN/Metadata/NameUtils.hpp>

#include <string>

namespace NGIN::Metadata
{

  const ParamDecl *MethodDecl::ParamAt(NGIN::UIntSize index) const noexcept
  {
    for (NGIN::UIntSize g = 0; g < groups.Size(); ++g)
    {
      if (index < groups[g].Size())
        return &groups[g][index];
      index -= groups[g].Size();
    }
    return nullptr;
  }

  const Annotation *AnnotationLevels::FindFirst(AnnotationTypeId type) const noexcept
  {
    for (NGIN::UIntSize l = 0; l < m_levels.Size(); ++l)
    {
      const auto &level = *m_levels[l];
      for (NGIN::UIntSize i = 0; i < level.Size(); ++i)
        if (level[i].IsA(type))
          return &level[i];
    }
    return nullptr;
  }

  bool AnnotationLevels::Contains(AnnotationTypeId type) const noexcept
  {
    return FindFirst(type) != nullptr;
  }

  AnnotationLevels AnnotationsOf(const InterfaceDecl &iface)
  {
    AnnotationLevels levels;
    levels.Push(iface.annotations);
    for (NGIN::UIntSize i = 0; i < iface.supertypes.Size(); ++i)
      levels.Push(iface.supertypes[i].annotations);
    return levels;
  }

  AnnotationLevels AnnotationsOf(const MethodDecl &method)
  {
    AnnotationLevels levels;
    levels.Push(method.annotations);
    for (NGIN::UIntSize i = 0; i < method.overridden.Size(); ++i)
      levels.Push(method.overridden[i].annotations);
    return levels;
  }

  AnnotationLevels AnnotationsOf(const MethodDecl &method, const ParamDecl &param)
  {
    AnnotationLevels levels;
    levels.Push(param.annotations);
    for (NGIN::UIntSize i = 0; i < method.overridden.Size(); ++i)
    {
      const auto &o = method.overridden[i];
      if (param.index < o.paramAnnotations.Size())
        levels.Push(o.paramAnnotations[param.index]);
    }
    return levels;
  }

  MethodDecl &MethodBuilder::Decl()
  {
    return m_owner->m_decl.methods[m_index];
  }

  MethodBuilder &MethodBuilder::Annotate(Annotation annotation)
  {
    Decl().annotations.PushBack(std::move(annotation));
    return *this;
  }

  MethodBuilder &MethodBuilder::Param(std::string_view name, TypeRef type, ParamFlags flags, std::source_location loc)
  {
    auto &m = Decl();
    if (m.groups.Size() == 0)
      m.groups.PushBack(NGIN::Containers::Vector<ParamDecl>{});
    const auto total = m.ParameterCount();
    auto &group = m.groups[m.groups.Size() - 1];

    ParamDecl p{};
    p.name = detail::InternName(name);
    p.type = type;
    p.index = static_cast<NGIN::UInt32>(total);
    p.groupIndex = static_cast<NGIN::UInt32>(m.groups.Size() - 1);
    p.indexInGroup = static_cast<NGIN::UInt32>(group.Size());
    p.flags = flags;
    p.location = SourceLocation::From(loc);
    group.PushBack(std::move(p));
    return *this;
  }

  MethodBuilder &MethodBuilder::ParamAnnotate(Annotation annotation)
  {
    auto &m = Decl();
    for (auto g = m.groups.Size(); g > 0; --g)
    {
      auto &group = m.groups[g - 1];
      if (group.Size() > 0)
      {
        group[group.Size() - 1].annotations.PushBack(std::move(annotation));
        break;
      }
    }
    return *this;
  }

  MethodBuilder &MethodBuilder::NextGroup()
  {
    auto &m = Decl();
    if (m.groups.Size() == 0)
      m.groups.PushBack(NGIN::Containers::Vector<ParamDecl>{});
    m.groups.PushBack(NGIN::Containers::Vector<ParamDecl>{});
    return *this;
  }

  MethodBuilder &MethodBuilder::Overrides(std::string_view owner)
  {
    OverriddenDecl o{};
    o.owner = detail::InternName(owner);
    Decl().overridden.PushBack(std::move(o));
    return *this;
  }

  MethodBuilder &MethodBuilder::OverriddenAnnotate(Annotation annotation)
  {
    auto &m = Decl();
    if (m.overridden.Size() == 0)
      m.overridden.PushBack(OverriddenDecl{});
    m.overridden[m.overridden.Size() - 1].annotations.PushBack(std::move(annotation));
    return *this;
  }

  MethodBuilder &MethodBuilder::OverriddenParamAnnotate(NGIN::UInt32 paramIndex, Annotation annotation)
  {
    auto &m = Decl();
    if (m.overridden.Size() == 0)
      m.overridden.PushBack(OverriddenDecl{});
    auto &o = m.overridden[m.overridden.Size() - 1];
    while (o.paramAnnotations.Size() <= paramIndex)
      o.paramAnnotations.PushBack(Annotations{});
    o.paramAnnotations[paramIndex].PushBack(std::move(annotation));
    return *this;
  }

  InterfaceBuilder::InterfaceBuilder(std::string_view name, std::source_location loc)
  {
    m_decl.name = detail::InternName(name);
    m_decl.type = TypeRef::Named(name);
    m_decl.location = SourceLocation::From(loc);
  }

  InterfaceBuilder &InterfaceBuilder::Annotate(Annotation annotation)
  {
    m_decl.annotations.PushBack(std::move(annotation));
    return *this;
  }

  InterfaceBuilder &InterfaceBuilder::Supertype(std::string_view name, std::initializer_list<Annotation> annotations)
  {
    SupertypeDecl s{};
    s.name = detail::InternName(name);
    for (const auto &a : annotations)
      s.annotations.PushBack(a);
    m_decl.supertypes.PushBack(std::move(s));
    return *this;
  }

  MethodBuilder InterfaceBuilder::Method(std::string_view name, TypeRef resultType, std::source_location loc)
  {
    MethodDecl m{};
    m.name = detail::InternName(name);
    m.resultType = resultType;
    m.index = static_cast<NGIN::UInt32>(m_decl.methods.Size());
    m.location = SourceLocation::From(loc);
    m_decl.methods.PushBack(std::move(m));
    return MethodBuilder{*this, static_cast<NGIN::UInt32>(m_decl.methods.Size() - 1)};
  }

  std::string_view InterfaceBuilder::GeneratedParamName(std::size_t i)
  {
    return detail::InternName("arg" + std::to_string(i));
  }

} // namespace NGIN::Metadata
