#include <rdf_sync/compare/sampler.hpp>

#include <algorithm>
#include <iterator>

namespace rdf_sync {

std::vector<std::string> SampleEntities(const Population& population,
                                        size_t max_size,
                                        std::mt19937_64& rng) {
    std::vector<std::string> out;
    if (population.size() <= max_size) {
        out.assign(population.begin(), population.end());
        return out;
    }
    out.reserve(max_size);
    // Selection sampling: stable, so the output stays sorted.
    std::sample(population.begin(), population.end(), std::back_inserter(out),
                max_size, rng);
    return out;
}

} // namespace rdf_sync
