#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "engine_config.hpp"

// Maps chunk index -> destination name. Runs once per upload; the result is persisted in the
// manifest so retries go back to the same destination.
class DistributionPolicy {
public:
  virtual ~DistributionPolicy() = default;
  virtual std::vector<std::string> assign(std::size_t chunk_count,
                                          const std::vector<Destination>& destinations) const = 0;
  virtual const char* name() const = 0;
};

class RoundRobinPolicy : public DistributionPolicy {
public:
  std::vector<std::string> assign(std::size_t chunk_count,
                                  const std::vector<Destination>& destinations) const override;
  const char* name() const override { return "round_robin"; }
};
