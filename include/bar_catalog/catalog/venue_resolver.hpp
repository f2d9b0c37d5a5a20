//===== venue_resolver.hpp =====
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "bar_catalog/core/error.hpp"
#include "bar_catalog/core/types.hpp"

namespace bar_catalog {

/**
 * @brief What a venue resolver may look at
 */
struct VenueContext {
    std::string instrument_id;
    const InstrumentDescriptor* descriptor{nullptr};
    const std::vector<Bar>* bars{nullptr};
};

using VenueResolverFn = std::function<std::optional<std::string>(const VenueContext&)>;

struct ResolvedVenue {
    std::string venue;
    std::string resolver;  // name of the resolver that answered
};

/**
 * @brief Ordered list of venue resolvers; the first answer wins
 */
class VenueResolver {
public:
    VenueResolver() = default;

    /**
     * @brief Descriptor venue, then the venue in the bars' instrument id, then default_venue
     */
    static VenueResolver default_chain(const std::string& default_venue);

    void add(std::string name, VenueResolverFn resolver);

    /**
     * @brief Try each resolver in order
     * @return DATA_NOT_FOUND when no resolver produced a venue
     */
    Result<ResolvedVenue> resolve(const VenueContext& context) const;

    size_t size() const {
        return resolvers_.size();
    }

    static std::optional<std::string> from_descriptor(const VenueContext& context);
    static std::optional<std::string> from_bars(const VenueContext& context);
    static VenueResolverFn fixed(std::string venue);

private:
    std::vector<std::pair<std::string, VenueResolverFn>> resolvers_;
};

}  // namespace bar_catalog
