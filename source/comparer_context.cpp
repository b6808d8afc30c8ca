// comparer_context.cpp - Visited-pair bookkeeping

#include <deep_delta/comparer_context.h>
#include <deep_delta/type_registry.h>

#include <boost/container_hash/hash.hpp>

namespace deep_delta {

std::size_t ComparerContext::RefPairHash::operator()(const RefPair& pair) const noexcept
{
    std::size_t seed = 0;
    boost::hash_combine(seed, pair.left);
    boost::hash_combine(seed, pair.right);
    return seed;
}

ComparerContext::ComparerContext()
    : registry_(&default_registry())
{
}

ComparerContext::ComparerContext(ComparisonOptions options)
    : options_(options), registry_(&default_registry())
{
}

ComparerContext::ComparerContext(ComparisonOptions options, const TypeRegistry& registry)
    : options_(options), registry_(&registry)
{
}

ComparerContext ComparerContext::no_tracking(ComparisonOptions options)
{
    ComparerContext ctx(options);
    ctx.tracking_ = false;
    return ctx;
}

bool ComparerContext::enter(const void* left, const void* right)
{
    if (!tracking_) {
        return true;
    }
    return visited_.insert(RefPair{left, right}).second;
}

void ComparerContext::exit(const void* left, const void* right)
{
    if (!tracking_) {
        return;
    }
    visited_.erase(RefPair{left, right});
}

} // namespace deep_delta
