#pragma once

#include <memory>
#include <string>

#include "tokbench/encoder.hpp"

namespace tokbench {

// Drives the Python tiktoken package through an embedded interpreter that
// stays alive for the rest of the process.
std::unique_ptr<Encoder> MakeTiktokenEncoder(const std::string& encoding);

}  // namespace tokbench
