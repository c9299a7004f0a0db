#include "core/types/Device.hpp"

namespace lanwatch::core {

std::string Device::displayName() const {
    if (customName && !customName->empty()) {
        return *customName;
    }
    if (hostname && !hostname->empty()) {
        return *hostname;
    }
    return ipAddress;
}

} // namespace lanwatch::core
