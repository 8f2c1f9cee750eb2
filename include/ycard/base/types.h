#pragma once

#include <cstdint>

namespace ycard {
namespace base {

using ObjectId = uint64_t;

} // namespace base
} // namespace ycard
