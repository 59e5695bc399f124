#include "wirecast/io/StreamIO.hpp"
#include "wirecast/log/Log.hpp"

namespace wirecast::io {

std::error_code readExact(std::istream& in, core::MutableByteView dst) {
    if (dst.empty()) {
        return {};
    }
    in.read(reinterpret_cast<char*>(dst.data()), static_cast<std::streamsize>(dst.size()));
    const auto got = static_cast<std::size_t>(in.gcount());
    if (got == dst.size()) {
        return {};
    }
    const bool eof = in.eof();
    logError("[wirecast] short read: got ", got, " of ", dst.size(), " bytes\n");
    return make_error_code(eof ? IoErrc::UnexpectedEof : IoErrc::StreamFailure);
}

std::error_code writeAll(std::ostream& out, core::ByteView src) {
    if (src.empty()) {
        return {};
    }
    out.write(reinterpret_cast<const char*>(src.data()), static_cast<std::streamsize>(src.size()));
    if (!out) {
        logError("[wirecast] write of ", src.size(), " bytes failed\n");
        return make_error_code(IoErrc::StreamFailure);
    }
    return {};
}

} // namespace wirecast::io
