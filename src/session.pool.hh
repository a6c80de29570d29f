#pragma once

#include "http.hh"
#include "s3.auth.hh"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace chunkstore {
/**
 * @brief One HTTP connection to the store, with its authorisation scheme.
 * Not thread safe; take one from a SessionPool per thread.
 */
class Session final
{
  public:
    Session(const Session&) = delete;
    Session(std::unique_ptr<HttpBackend> backend,
            std::shared_ptr<const Auth> auth,
            std::optional<std::chrono::milliseconds> timeout);

    /**
     * @brief Authorise and send @p request.
     * @return The response, whatever its status code.
     * @throw AuthorisationFailed if the credentials do not cover the request.
     * @throw TransportError if no complete response was received.
     */
    HttpResponse send(HttpRequest& request);

  private:
    std::unique_ptr<HttpBackend> backend_;
    std::shared_ptr<const Auth> auth_;
    std::optional<std::chrono::milliseconds> timeout_;
};

/**
 * @brief Hands out sessions to concurrent callers. Sessions are created on
 * demand and kept for reuse once returned, so the pool grows to the peak
 * number of concurrent users.
 */
class SessionPool final
{
  public:
    using SessionFactory = std::function<std::unique_ptr<Session>()>;

    explicit SessionPool(SessionFactory factory);

    std::unique_ptr<Session> get_session();
    void return_session(std::unique_ptr<Session>&& session);

    /// Number of idle sessions.
    size_t size() const;

  private:
    SessionFactory factory_;
    std::vector<std::unique_ptr<Session>> sessions_;
    mutable std::mutex sessions_mutex_;
};

/// Borrows a session for the lifetime of the object.
class ScopedSession final
{
  public:
    explicit ScopedSession(SessionPool& pool)
      : pool_{ pool }
      , session_{ pool.get_session() }
    {
    }
    ScopedSession(const ScopedSession&) = delete;
    ~ScopedSession() { pool_.return_session(std::move(session_)); }

    Session* operator->() const noexcept { return session_.get(); }

  private:
    SessionPool& pool_;
    std::unique_ptr<Session> session_;
};
} // namespace chunkstore
