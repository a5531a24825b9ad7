#include "liveprogress/errors.hpp"

#include <utility>

namespace liveprogress {

HttpError classifyStatus(int code) {
    switch (code) {
    case 400:
    case 405:
        return HttpError::Rejected;
    case 401:
    case 403:
        return HttpError::NotAllowed;
    case 404:
    case 410:
        return HttpError::NotFound;
    case 408:
    case 503:
        return HttpError::Unavailable;
    default:
        return HttpError::Unspecified;
    }
}

const char* toString(HttpError type) {
    switch (type) {
    case HttpError::Rejected:
        return "Rejected";
    case HttpError::NotAllowed:
        return "NotAllowed";
    case HttpError::NotFound:
        return "NotFound";
    case HttpError::Unavailable:
        return "Unavailable";
    case HttpError::Unspecified:
        break;
    }
    return "Unspecified";
}

ServiceError::ServiceError(const std::string& message, int code, std::string body)
    : std::runtime_error(message),
      code_(code),
      body_(std::move(body)),
      type_(classifyStatus(code)) {}

} // namespace liveprogress
