#include "session.pool.hh"
#include "macros.hh"

chunkstore::Session::Session(std::unique_ptr<HttpBackend> backend,
                             std::shared_ptr<const Auth> auth,
                             std::optional<std::chrono::milliseconds> timeout)
  : backend_{ std::move(backend) }
  , auth_{ std::move(auth) }
  , timeout_{ timeout }
{
    CHECK(backend_);
    CHECK(auth_);
}

chunkstore::HttpResponse
chunkstore::Session::send(HttpRequest& request)
{
    apply_auth(*auth_, request);
    if (!request.timeout) {
        request.timeout = timeout_;
    }

    LOG_DEBUG(to_string(request.method), " ", request.url.str());
    HttpResponse response = backend_->execute(request);

    if (!response.error.empty()) {
        const auto fault = response.timed_out ? TransportFault::Timeout
                                              : TransportFault::Connection;
        throw TransportError(fault,
                             std::string(to_string(request.method)) + " " +
                               request.url.str() + " failed: " +
                               response.error);
    }

    LOG_DEBUG(to_string(request.method),
              " ",
              request.url.str(),
              " -> ",
              response.status_code);
    return response;
}

chunkstore::SessionPool::SessionPool(SessionFactory factory)
  : factory_{ std::move(factory) }
{
    CHECK(factory_);
}

std::unique_ptr<chunkstore::Session>
chunkstore::SessionPool::get_session()
{
    {
        std::scoped_lock lock(sessions_mutex_);
        if (!sessions_.empty()) {
            auto session = std::move(sessions_.back());
            sessions_.pop_back();
            return session;
        }
    }

    // connecting can be slow; don't hold up other callers
    auto session = factory_();
    CHECK(session);
    return session;
}

void
chunkstore::SessionPool::return_session(std::unique_ptr<Session>&& session)
{
    if (!session) {
        return;
    }

    std::scoped_lock lock(sessions_mutex_);
    sessions_.push_back(std::move(session));
}

size_t
chunkstore::SessionPool::size() const
{
    std::scoped_lock lock(sessions_mutex_);
    return sessions_.size();
}
