#include "distribution_policy.hpp"

#include "errors.hpp"

std::vector<std::string> RoundRobinPolicy::assign(std::size_t chunk_count,
                                                  const std::vector<Destination>& destinations) const {
  if(destinations.empty()) {
    throw ConfigurationError("no destinations available for chunk assignment");
  }
  std::vector<std::string> out;
  out.reserve(chunk_count);
  for(std::size_t i = 0; i < chunk_count; ++i) {
    out.push_back(destinations[i % destinations.size()].name);
  }
  return out;
}
