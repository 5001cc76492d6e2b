#pragma once

#include <string_view>

namespace almanac {

enum class StatusCode {
    Ok = 0,
    AlreadyExists,
    NotFound,
    InvalidArgument,
    OutOfRange,
    InvalidDate,
    UnsupportedVariant,
    EraMismatch,
    ResourceFormatError,
    InternalError
};

std::string_view StatusName(StatusCode status) noexcept;

}
