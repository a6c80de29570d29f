#include "minio.http.backend.hh"
#include "macros.hh"

#include <miniocpp/http.h>

namespace {
minio::http::Method
to_minio_method(chunkstore::HttpMethod method)
{
    using chunkstore::HttpMethod;

    switch (method) {
        case HttpMethod::Get:
            return minio::http::Method::kGet;
        case HttpMethod::Head:
            return minio::http::Method::kHead;
        case HttpMethod::Put:
            return minio::http::Method::kPut;
        case HttpMethod::Post:
            return minio::http::Method::kPost;
        case HttpMethod::Delete:
            return minio::http::Method::kDelete;
    }
    return minio::http::Method::kGet;
}
} // namespace

chunkstore::MinioHttpBackend::MinioHttpBackend(unsigned int max_retries)
  : max_retries_{ max_retries }
{
}

chunkstore::HttpResponse
chunkstore::MinioHttpBackend::execute(const HttpRequest& request)
{
    // minio-cpp takes the body as one contiguous view
    std::string joined;
    std::string_view body;
    if (request.body.size() == 1) {
        body = { reinterpret_cast<const char*>(request.body[0].data()),
                 request.body[0].size() };
    } else if (request.body.size() > 1) {
        joined.reserve(request.body_size());
        for (const auto& segment : request.body) {
            joined.append(reinterpret_cast<const char*>(segment.data()),
                          segment.size());
        }
        body = joined;
    }

    HttpResponse response;
    for (unsigned int attempt = 0;; ++attempt) {
        bool body_delivered = false;
        response = execute_once_(request, body, body_delivered);

        const bool connection_failed = !response.error.empty() &&
                                       response.status_code == 0 &&
                                       !response.timed_out;
        if (!connection_failed || body_delivered || attempt >= max_retries_) {
            break;
        }

        LOG_WARNING("Retrying ",
                    to_string(request.method),
                    " ",
                    request.url.str(),
                    " after connection failure: ",
                    response.error);
    }

    return response;
}

chunkstore::HttpResponse
chunkstore::MinioHttpBackend::execute_once_(const HttpRequest& request,
                                            std::string_view body,
                                            bool& body_delivered)
{
    minio::http::Url url(request.url.https,
                         request.url.host,
                         request.url.port,
                         request.url.path,
                         request.url.query);
    minio::http::Request req(to_minio_method(request.method), url);

    for (const auto& [key, value] : request.headers) {
        req.headers.Add(key, value);
    }
    req.body = body;

    HttpResponse response;

    if (request.on_body) {
        req.datafunc = [&request, &body_delivered](
                         minio::http::DataFunctionArgs args) -> bool {
            // minio-cpp only streams 2xx bodies; others land in resp.body
            body_delivered = true;
            return request.on_body(std::as_bytes(std::span(
              args.datachunk.data(), args.datachunk.size())));
        };
    }

    if (request.timeout) {
        const auto deadline = std::chrono::steady_clock::now() + *request.timeout;
        req.progressfunc = [deadline, &response](
                             minio::http::ProgressFunctionArgs) -> bool {
            if (std::chrono::steady_clock::now() > deadline) {
                response.timed_out = true;
                return false;
            }
            return true;
        };
    }

    try {
        minio::http::Response resp = req.Execute();
        response.status_code = resp.status_code;
        response.body = std::move(resp.body);
        response.error = std::move(resp.error);
    } catch (const std::exception& exc) {
        response.error = exc.what();
    }

    if (response.timed_out && response.error.empty()) {
        response.error = "deadline exceeded";
    }

    return response;
}
