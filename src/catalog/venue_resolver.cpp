//===== venue_resolver.cpp =====

#include "bar_catalog/catalog/venue_resolver.hpp"
#include "bar_catalog/core/logger.hpp"

namespace bar_catalog {

VenueResolver VenueResolver::default_chain(const std::string& default_venue) {
    VenueResolver chain;
    chain.add("descriptor", &VenueResolver::from_descriptor);
    chain.add("bars", &VenueResolver::from_bars);
    chain.add("default", fixed(default_venue));
    return chain;
}

void VenueResolver::add(std::string name, VenueResolverFn resolver) {
    resolvers_.emplace_back(std::move(name), std::move(resolver));
}

Result<ResolvedVenue> VenueResolver::resolve(const VenueContext& context) const {
    for (const auto& [name, resolver] : resolvers_) {
        auto venue = resolver(context);
        if (venue && !venue->empty()) {
            DEBUG("Venue " << *venue << " for " << context.instrument_id << " from " << name
                           << " resolver");
            return Result<ResolvedVenue>(ResolvedVenue{*venue, name});
        }
    }
    return make_error<ResolvedVenue>(ErrorCode::DATA_NOT_FOUND,
                                     "No venue resolver produced a venue for " +
                                         context.instrument_id,
                                     "VenueResolver");
}

std::optional<std::string> VenueResolver::from_descriptor(const VenueContext& context) {
    if (context.descriptor == nullptr || context.descriptor->venue.empty()) {
        return std::nullopt;
    }
    return context.descriptor->venue;
}

std::optional<std::string> VenueResolver::from_bars(const VenueContext& context) {
    if (context.bars == nullptr || context.bars->empty()) {
        return std::nullopt;
    }
    auto id = InstrumentId::parse(context.bars->front().instrument_id);
    if (!id) {
        return std::nullopt;
    }
    return id->venue;
}

VenueResolverFn VenueResolver::fixed(std::string venue) {
    return [venue = std::move(venue)](const VenueContext&) -> std::optional<std::string> {
        return venue;
    };
}

}  // namespace bar_catalog
