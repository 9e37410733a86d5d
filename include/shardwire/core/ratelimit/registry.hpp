#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "shardwire/core/ratelimit/gate.hpp"


namespace shardwire::core::ratelimit {

/*
===============================================================================
 ratelimit::Registry
===============================================================================

Maps route-classes to Gates and reconciles them once the server reveals which
bucket a route-class belongs to.

Keys:
  route key     -> "<route class>|<major parameters>"
  bucket key    -> "<server bucket hash>|<major parameters>"

Before the first response a route key gets a provisional Gate with an empty
LedgerEntry. discover() binds the route-class to the server bucket hash; when
another route-class already owns a Gate for the same bucket, the handles are
rewritten so both share one Gate (and its entry). No limit data is copied:

  - the existing Gate is dirty  -> route keys are rewritten to it
  - the existing Gate is clean  -> it is replaced by the route's Gate, which
                                   has observed real usage

Later route keys of an already discovered route-class resolve straight to
the bucket key. Gates are never erased while referenced by a route key.
===============================================================================
*/

class Registry {
public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    [[nodiscard]]
    std::shared_ptr<Gate> gate_for(std::string_view route_class, std::string_view major);

    // Binds route_class to the server bucket hash and returns the Gate the
    // route key resolves to afterwards.
    std::shared_ptr<Gate> discover(std::string_view route_class, std::string_view major, std::string_view bucket_hash);

    [[nodiscard]]
    std::size_t route_count() const;

    [[nodiscard]]
    std::size_t bucket_count() const;

private:
    [[nodiscard]]
    static std::string join_(std::string_view a, std::string_view b);

    void rewrite_(const std::shared_ptr<Gate>& from, const std::shared_ptr<Gate>& to);

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Gate>> routes_;
    std::unordered_map<std::string, std::shared_ptr<Gate>> buckets_;
    std::unordered_map<std::string, std::string> hashes_; // route class -> bucket hash
};

} // namespace shardwire::core::ratelimit
