#include "s3.status.hh"
#include "macros.hh"

#include <tinyxml2.h>

#include <algorithm>

chunkstore::S3ErrorInfo
chunkstore::parse_s3_error(std::string_view body)
{
    S3ErrorInfo info;

    tinyxml2::XMLDocument doc;
    if (body.empty() ||
        doc.Parse(body.data(), body.size()) != tinyxml2::XML_SUCCESS) {
        return info;
    }

    const auto* error = doc.FirstChildElement("Error");
    if (error == nullptr) {
        return info;
    }
    if (const auto* code = error->FirstChildElement("Code");
        code && code->GetText()) {
        info.code = code->GetText();
    }
    if (const auto* message = error->FirstChildElement("Message");
        message && message->GetText()) {
        info.message = message->GetText();
    }

    return info;
}

void
chunkstore::raise_for_status(const HttpRequest& request,
                             const HttpResponse& response,
                             std::initializer_list<int> ignored_statuses,
                             size_t base_segments)
{
    const int status = response.status_code;
    if (response.ok() || std::find(ignored_statuses.begin(),
                                   ignored_statuses.end(),
                                   status) != ignored_statuses.end()) {
        return;
    }

    std::string msg = "Store responded with " + std::to_string(status);
    if (const auto reason = reason_phrase(status); !reason.empty()) {
        msg += " " + std::string(reason);
    }
    msg += " to request: " + std::string(to_string(request.method)) + " " +
           request.url.str();

    if (const auto info = parse_s3_error(response.body); !info.code.empty()) {
        msg += " (" + info.code;
        if (!info.message.empty()) {
            msg += ": " + info.message;
        }
        msg += ")";
    }

    ErrorKind kind = ErrorKind::StoreUnavailable;
    if (status == 401) {
        kind = ErrorKind::AuthorisationFailed;
    } else if ((status == 403 || status == 404) &&
               request.url.path_segments() > base_segments + 1) {
        // the server is there but the object is not (or is hidden from us)
        kind = ErrorKind::ChunkNotFound;
    }

    if (kind == ErrorKind::ChunkNotFound) {
        LOG_DEBUG(msg);
    } else {
        LOG_ERROR(msg);
    }
    raise_error(kind, msg);
}
