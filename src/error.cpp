#include "error.hpp"

namespace tsid {

const char* errc_name(Errc code) {
    switch (code) {
        case Errc::ok:                return "Ok";
        case Errc::clock_unavailable: return "ClockUnavailable";
        case Errc::type_mismatch:     return "TypeMismatch";
        case Errc::invalid_length:    return "InvalidLength";
        case Errc::invalid_format:    return "InvalidFormat";
        case Errc::invalid_argument:  return "InvalidArgument";
        default: return "?";
    }
}

std::string Error::to_string() const {
    std::string out = errc_name(code);
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

Error make_error(Errc code, std::string message, size_t length) {
    Error e;
    e.code = code;
    e.message = std::move(message);
    e.length = length;
    return e;
}

} // namespace tsid
