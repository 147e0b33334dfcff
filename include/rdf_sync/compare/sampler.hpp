#pragma once

#include <rdf_sync/compare/population.hpp>

#include <cstddef>
#include <random>
#include <string>
#include <vector>

namespace rdf_sync {

/// Bounded subset of a population for triple-level comparison.
///
/// |population| <= max_size: the whole population, sorted.
/// Otherwise exactly max_size distinct members drawn uniformly without
/// replacement, kept in sorted order.
[[nodiscard]] std::vector<std::string> SampleEntities(const Population& population,
                                                      size_t max_size,
                                                      std::mt19937_64& rng);

} // namespace rdf_sync
