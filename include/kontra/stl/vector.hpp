#pragma once

#include "kontra/memory.hpp"

#include <vector>


namespace kon::stl {

template <typename T>
using vector = std::vector<T, gc_allocator<T>>;

} // namespace kon::stl
