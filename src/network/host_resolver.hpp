//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// network/host_resolver.hpp
//
// Expansion of host specifications into ordered candidate lists
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <vector>

namespace exaconn {

// Expand a host specification:
//   "exasol1,127.0.0.1"  -> comma list, resolved entry by entry
//   "exasol1..3"         -> exasol1, exasol2, exasol3
//   "10.0.0.08..11"      -> 10.0.0.08, 10.0.0.09, 10.0.0.10, 10.0.0.11
// Entries that are not a numeric range pass through unchanged.
// Throws InvalidArgumentError when the upper limit is below the lower one.
std::vector<std::string> ResolveHosts(const std::string& spec);

} // namespace exaconn
