// Context.hpp
// Contextual instance resolution: the resolver interface and an injectable registry.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/Interface.hpp>
#include <NGIN/Metadata/NameUtils.hpp>
#include <NGIN/Metadata/Types.hpp>
#include <NGIN/Metadata/Value.hpp>

#include <memory>
#include <utility>

namespace NGIN::Metadata
{

  // Source of contextual instances. Implementations must be synchronous and side-effect free.
  class NGIN_METADATA_API ContextResolver
  {
  public:
    virtual ~ContextResolver() = default;

    // Instance for `key`, or null when none is available.
    [[nodiscard]] virtual std::shared_ptr<const Any> Lookup(const ContextKey &key) const = 0;
    // Lookup used by checked parameters, whose absence rejects the surrounding match.
    [[nodiscard]] virtual std::shared_ptr<const Any> LookupStrict(const ContextKey &key) const { return Lookup(key); }
  };

  class NGIN_METADATA_API ContextRegistry final : public ContextResolver
  {
  public:
    template <class T>
    ContextRegistry &Register(T value)
    {
      return Put(ContextKey{detail::TypeIdOf<T>(), 0}, std::make_shared<const Any>(Any{std::move(value)}));
    }

    // Instance used only for declarations whose type is `subject`; takes precedence over Register<T>.
    template <class T>
    ContextRegistry &RegisterFor(TypeRef subject, T value)
    {
      return Put(ContextKey{detail::TypeIdOf<T>(), subject.id}, std::make_shared<const Any>(Any{std::move(value)}));
    }

    [[nodiscard]] std::shared_ptr<const Any> Lookup(const ContextKey &key) const override;

    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_entries.Size(); }

  private:
    struct Entry
    {
      ContextKey key{};
      std::shared_ptr<const Any> instance{};
    };

    ContextRegistry &Put(ContextKey key, std::shared_ptr<const Any> instance);

    NGIN::Containers::Vector<Entry> m_entries{};
    // Requested type -> indices of its entries, one per subject.
    NGIN::Containers::FlatHashMap<TypeId, NGIN::Containers::Vector<NGIN::UInt32>> m_byRequested{};
  };

} // namespace NGIN::Metadata
