#pragma once

#include <cstddef>
#include <cstdint>

namespace revdiff::hash {

uint32_t
hash(const char* input, std::size_t len);

}  // namespace revdiff::hash
