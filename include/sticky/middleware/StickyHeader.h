#pragma once

#include <memory>
#include <string>

#include "sticky/protocol/HttpRequest.h"
#include "sticky/protocol/ResponseWriter.h"
#include "sticky/common/noncopyable.h"

namespace sticky {
namespace common {
class Config;
}

namespace middleware {

// The query parameter and the response header share one name on purpose.
extern const char kBackendHeader[];
extern const char kBackendQueryParam[];
extern const char kBackendCookie[];
extern const char kExposeHeaders[];

struct StickyHeaderOptions {
    // Path of the cookie emitted when the backend came from the query string.
    std::string cookiePath{"/"};
    // When set, every response that pins a backend also expires a stale
    // affinity cookie scoped to this path. Empty disables it.
    std::string legacyCookiePath;

    // Reads [sticky_header] cookie_path and legacy_cookie_path.
    static StickyHeaderOptions FromConfig(const sticky::common::Config& conf);
};

// What the request phase learned from the inbound request.
struct AffinityRequestState {
    bool cookiePresent{false};
    // Non-empty only when the cookie is absent and the query names a backend.
    std::string backendFromQuery;
};

AffinityRequestState InspectRequest(const sticky::protocol::HttpRequest& req);

// Append `value` to a comma-separated list header, keeping whatever other
// middlewares already put there.
void AddOrAppendHeader(sticky::protocol::HttpHeaders& headers,
                       const std::string& name,
                       const std::string& value);

// Wraps the downstream writer for one exchange. On the first status write
// it reconciles the affinity cookie with the X-Traefik-Backend header, then
// passes everything through. Flush and takeover are offered only if the
// wrapped writer has them.
class BackendHeaderWriter : public sticky::protocol::ResponseWriter,
                            public sticky::protocol::Flusher,
                            public sticky::protocol::Hijacker,
                            sticky::common::noncopyable {
public:
    BackendHeaderWriter(sticky::protocol::ResponseWriter& inner,
                        std::string backendFromQuery,
                        const StickyHeaderOptions& options);

    sticky::protocol::HttpHeaders& header() override { return inner_.header(); }
    void writeHeader(int statusCode) override;
    size_t write(const char* data, size_t len) override;
    using sticky::protocol::ResponseWriter::write;

    // false when the wrapped writer cannot flush.
    bool flush() override;
    // nullptr when the wrapped writer cannot hand out its connection.
    std::unique_ptr<sticky::network::Socket> hijack() override;

    sticky::protocol::Flusher* tryGetFlusher() override;
    sticky::protocol::Hijacker* tryGetHijacker() override;

    // Writes status 200 unless a status was written or the connection was
    // taken over.
    void finish();

    bool wroteHeader() const { return wroteHeader_; }
    bool hijacked() const { return hijacked_; }
    // Backend published in the header, empty if none.
    const std::string& resolvedBackend() const { return resolvedBackend_; }

private:
    void applyAffinity();
    void expireLegacyCookie();

    sticky::protocol::ResponseWriter& inner_;
    sticky::protocol::Flusher* innerFlusher_;
    sticky::protocol::Hijacker* innerHijacker_;
    const std::string backendFromQuery_;
    const StickyHeaderOptions& options_;
    std::string resolvedBackend_;
    bool wroteHeader_{false};
    bool hijacked_{false};
};

// Keeps the _TRAEFIK_BACKEND cookie and the X-Traefik-Backend header in
// sync. A request without the cookie may name a backend with
// ?X-Traefik-Backend=...; the next handler then sees it as a cookie.
// A Set-Cookie from the next handler always wins over the query.
class StickyHeader {
public:
    explicit StickyHeader(sticky::protocol::HttpHandler next,
                          StickyHeaderOptions options = StickyHeaderOptions());

    void serveHttp(sticky::protocol::ResponseWriter& w, const sticky::protocol::HttpRequest& req) const;

    // Callable form for chaining in front of another middleware or server.
    sticky::protocol::HttpHandler asHandler() const;

    const StickyHeaderOptions& options() const { return options_; }

private:
    sticky::protocol::HttpHandler next_;
    StickyHeaderOptions options_;
};

} // namespace middleware
} // namespace sticky
