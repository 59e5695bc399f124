#include "wirecast/core/ByteArray.hpp"

#include <iomanip>
#include <sstream>

namespace wirecast::core {

std::string toHexLine(ByteView bytes) {
    if (!bytes.data() || bytes.empty()) {
        return {};
    }

    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i) os << ' ';
        os << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return os.str();
}

} // namespace wirecast::core
