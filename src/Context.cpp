#include <NGIN/Metadata/Context.hpp>

namespace NGIN::Metadata
{

  ContextRegistry &ContextRegistry::Put(ContextKey key, std::shared_ptr<const Any> instance)
  {
    if (auto *bucket = m_byRequested.GetPtr(key.requested))
    {
      for (NGIN::UIntSize i = 0; i < bucket->Size(); ++i)
      {
        auto &e = m_entries[(*bucket)[i]];
        if (e.key.subject == key.subject)
        {
          e.instance = std::move(instance);
          return *this;
        }
      }
      bucket->PushBack(static_cast<NGIN::UInt32>(m_entries.Size()));
    }
    else
    {
      NGIN::Containers::Vector<NGIN::UInt32> v;
      v.PushBack(static_cast<NGIN::UInt32>(m_entries.Size()));
      m_byRequested.Insert(key.requested, std::move(v));
    }
    m_entries.PushBack(Entry{key, std::move(instance)});
    return *this;
  }

  std::shared_ptr<const Any> ContextRegistry::Lookup(const ContextKey &key) const
  {
    const auto *bucket = m_byRequested.GetPtr(key.requested);
    if (!bucket)
      return nullptr;
    // The subject-specific entry wins; the subject-independent one is the fallback.
    const Entry *fallback = nullptr;
    for (NGIN::UIntSize i = 0; i < bucket->Size(); ++i)
    {
      const auto &e = m_entries[(*bucket)[i]];
      if (e.key.subject == key.subject)
        return e.instance;
      if (e.key.subject == 0)
        fallback = &e;
    }
    return fallback ? fallback->instance : nullptr;
  }

} // namespace NGIN::Metadata
