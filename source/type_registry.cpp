// type_registry.cpp - Runtime-type dispatch table

#include <deep_delta/type_registry.h>
#include <deep_delta/errors.h>

#include <mutex>

namespace deep_delta {

void TypeRegistry::add(TypeOps ops)
{
    auto entry = std::make_shared<const TypeOps>(std::move(ops));
    std::unique_lock lock(mutex_);
    const std::type_index type = entry->type;
    entries_.insert_or_assign(type, std::move(entry));
}

std::shared_ptr<const TypeOps> TypeRegistry::find(std::type_index type) const
{
    std::shared_lock lock(mutex_);
    auto it = entries_.find(type);
    return it == entries_.end() ? nullptr : it->second;
}

std::shared_ptr<const TypeOps> TypeRegistry::require(std::type_index type) const
{
    if (auto ops = find(type)) {
        return ops;
    }
    throw type_not_registered(type.name());
}

bool TypeRegistry::contains(std::type_index type) const
{
    std::shared_lock lock(mutex_);
    return entries_.count(type) != 0;
}

std::size_t TypeRegistry::size() const
{
    std::shared_lock lock(mutex_);
    return entries_.size();
}

TypeRegistry& default_registry()
{
    static TypeRegistry registry;
    return registry;
}

} // namespace deep_delta
