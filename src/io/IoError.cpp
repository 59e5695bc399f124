#include "wirecast/io/IoError.hpp"

#include <string>

namespace wirecast::io {

namespace {

class IoCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "wirecast.io"; }

    std::string message(int ev) const override {
        switch (static_cast<IoErrc>(ev)) {
            case IoErrc::UnexpectedEof: return "unexpected end of stream";
            case IoErrc::StreamFailure: return "stream failure";
        }
        return "unknown wirecast.io error";
    }
};

} // namespace

const std::error_category& ioCategory() noexcept {
    static const IoCategory category;
    return category;
}

std::error_code make_error_code(IoErrc e) noexcept {
    return {static_cast<int>(e), ioCategory()};
}

} // namespace wirecast::io
