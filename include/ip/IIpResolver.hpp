#pragma once

#include <string>

namespace ddns::ip {

/// Pure abstract interface for public IP discovery.
class IIpResolver {
 public:
  virtual ~IIpResolver() = default;

  /// Returns the caller's public IP as literal text. Throws on failure.
  virtual std::string fetch() = 0;
};

}  // namespace ddns::ip
