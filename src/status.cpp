#include "almanac/status.h"

namespace almanac {

std::string_view StatusName(StatusCode status) noexcept {
    switch (status) {
        case StatusCode::Ok:
            return "Ok";
        case StatusCode::AlreadyExists:
            return "AlreadyExists";
        case StatusCode::NotFound:
            return "NotFound";
        case StatusCode::InvalidArgument:
            return "InvalidArgument";
        case StatusCode::OutOfRange:
            return "OutOfRange";
        case StatusCode::InvalidDate:
            return "InvalidDate";
        case StatusCode::UnsupportedVariant:
            return "UnsupportedVariant";
        case StatusCode::EraMismatch:
            return "EraMismatch";
        case StatusCode::ResourceFormatError:
            return "ResourceFormatError";
        case StatusCode::InternalError:
            return "InternalError";
    }
    return "Unknown";
}

}
