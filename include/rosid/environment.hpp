#pragma once

#include <map>
#include <string>

namespace rosid {

// Variable name -> value, as seen by condition evaluation and child processes
using Environment = std::map<std::string, std::string>;

// Snapshot of the calling process' environment
Environment current_environment();

} // namespace rosid
