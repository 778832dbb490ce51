#include "rangepart/core/errors.h"

namespace rangepart {

std::string_view
to_string(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::None:
            return "None";
        case ErrorKind::InvalidInput:
            return "InvalidInput";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::AccessDenied:
            return "AccessDenied";
        case ErrorKind::TransientIO:
            return "TransientIOError";
        case ErrorKind::PublishFailure:
            return "PublishFailure";
        case ErrorKind::Cancelled:
            return "Cancelled";
        case ErrorKind::Internal:
            return "Internal";
    }
    return "Unknown";
}

}  // namespace rangepart
