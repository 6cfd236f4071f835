#include "cpamm/asset.hpp"

#include <ostream>

namespace cpamm {

std::ostream& operator<<(std::ostream& os, const AssetInfo& info) {
    return os << info.to_string();
}

std::ostream& operator<<(std::ostream& os, const Asset& asset) {
    return os << asset.to_string();
}

} // namespace cpamm
