#include "wirecast/core/Discriminant.hpp"

#include <ostream>
#include <sstream>

namespace wirecast::core {

const char* kindSuffix(Discriminant::Kind kind) {
    switch (kind) {
        case Discriminant::Kind::U8:  return "u8";
        case Discriminant::Kind::U16: return "u16";
        case Discriminant::Kind::U32: return "u32";
        case Discriminant::Kind::U64: return "u64";
        case Discriminant::Kind::I8:  return "i8";
        case Discriminant::Kind::I16: return "i16";
        case Discriminant::Kind::I32: return "i32";
        case Discriminant::Kind::I64: return "i64";
    }
    return "?";
}

std::string Discriminant::toString() const {
    std::ostringstream os;
    if (isSigned()) {
        os << asSigned();
    } else {
        os << asUnsigned();
    }
    os << kindSuffix(kind_);
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const Discriminant& d) {
    return os << d.toString();
}

std::string EnumFromBytesError::message() const {
    std::ostringstream os;
    os << "Invalid discriminant " << invalid_ << " for type " << typeName_;
    return os.str();
}

std::string EnumFromBytesError::describe() const {
    std::ostringstream os;
    os << "EnumFromBytesError { invalidDiscriminant: " << invalid_
       << ", typeName: \"" << typeName_ << "\" }";
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const EnumFromBytesError& error) {
    return os << error.message();
}

} // namespace wirecast::core
