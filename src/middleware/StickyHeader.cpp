#include "sticky/middleware/StickyHeader.h"
#include "sticky/protocol/Cookie.h"
#include "sticky/common/Config.h"
#include "sticky/common/Logger.h"

#include <utility>

namespace sticky {
namespace middleware {

using sticky::protocol::Cookie;
using sticky::protocol::HttpHeaders;
using sticky::protocol::HttpRequest;
using sticky::protocol::ResponseWriter;

const char kBackendHeader[] = "X-Traefik-Backend";
const char kBackendQueryParam[] = "X-Traefik-Backend";
const char kBackendCookie[] = "_TRAEFIK_BACKEND";
const char kExposeHeaders[] = "Access-Control-Expose-Headers";

static const char kEpochDate[] = "Thu, 01 Jan 1970 00:00:00 GMT";

StickyHeaderOptions StickyHeaderOptions::FromConfig(const sticky::common::Config& conf) {
    StickyHeaderOptions options;
    options.cookiePath = conf.GetString("sticky_header", "cookie_path", options.cookiePath);
    options.legacyCookiePath = conf.GetString("sticky_header", "legacy_cookie_path", "");
    return options;
}

AffinityRequestState InspectRequest(const HttpRequest& req) {
    AffinityRequestState state;
    if (req.cookie(kBackendCookie)) {
        state.cookiePresent = true;
        return state;
    }
    state.backendFromQuery = req.queryParams().get(kBackendQueryParam);
    return state;
}

void AddOrAppendHeader(HttpHeaders& headers, const std::string& name, const std::string& value) {
    std::string current;
    for (const auto& v : headers.values(name)) {
        if (v.empty()) continue;
        if (!current.empty()) current += ", ";
        current += v;
    }
    if (current.empty()) {
        headers.set(name, value);
    } else {
        headers.set(name, current + ", " + value);
    }
}

BackendHeaderWriter::BackendHeaderWriter(ResponseWriter& inner,
                                         std::string backendFromQuery,
                                         const StickyHeaderOptions& options)
    : inner_(inner),
      innerFlusher_(inner.tryGetFlusher()),
      innerHijacker_(inner.tryGetHijacker()),
      backendFromQuery_(std::move(backendFromQuery)),
      options_(options) {}

void BackendHeaderWriter::writeHeader(int statusCode) {
    if (!wroteHeader_) {
        wroteHeader_ = true;
        applyAffinity();
    }
    inner_.writeHeader(statusCode);
}

size_t BackendHeaderWriter::write(const char* data, size_t len) {
    if (!wroteHeader_) writeHeader(200);
    return inner_.write(data, len);
}

sticky::protocol::Flusher* BackendHeaderWriter::tryGetFlusher() {
    return innerFlusher_ ? this : nullptr;
}

sticky::protocol::Hijacker* BackendHeaderWriter::tryGetHijacker() {
    return innerHijacker_ ? this : nullptr;
}

bool BackendHeaderWriter::flush() {
    if (!innerFlusher_) {
        LOG_DEBUG << "StickyHeader: flush requested, wrapped writer cannot flush";
        return false;
    }
    if (!wroteHeader_) writeHeader(200);
    return innerFlusher_->flush();
}

std::unique_ptr<sticky::network::Socket> BackendHeaderWriter::hijack() {
    if (!innerHijacker_) {
        LOG_DEBUG << "StickyHeader: hijack requested, wrapped writer cannot hand out its connection";
        return nullptr;
    }
    auto conn = innerHijacker_->hijack();
    if (conn) hijacked_ = true;
    return conn;
}

void BackendHeaderWriter::finish() {
    if (!wroteHeader_ && !hijacked_) writeHeader(200);
}

void BackendHeaderWriter::expireLegacyCookie() {
    if (options_.legacyCookiePath.empty()) return;
    Cookie legacy(kBackendCookie, "");
    legacy.path = options_.legacyCookiePath;
    legacy.expires = kEpochDate;
    legacy.maxAge = 0;
    inner_.header().add("Set-Cookie", legacy.toSetCookieString());
}

void BackendHeaderWriter::applyAffinity() {
    HttpHeaders& headers = inner_.header();

    auto fromResponse = sticky::protocol::FindSetCookieValue(headers.values("Set-Cookie"), kBackendCookie);
    if (fromResponse && !fromResponse->empty()) {
        expireLegacyCookie();
        resolvedBackend_ = *fromResponse;
        headers.set(kBackendHeader, resolvedBackend_);
        LOG_DEBUG << "StickyHeader: backend " << resolvedBackend_ << " from response cookie";
    } else if (!backendFromQuery_.empty()) {
        expireLegacyCookie();
        Cookie cookie(kBackendCookie, backendFromQuery_);
        cookie.path = options_.cookiePath;
        headers.add("Set-Cookie", cookie.toSetCookieString());
        resolvedBackend_ = backendFromQuery_;
        headers.set(kBackendHeader, resolvedBackend_);
        LOG_DEBUG << "StickyHeader: backend " << resolvedBackend_ << " from query string";
    }

    AddOrAppendHeader(headers, kExposeHeaders, kBackendHeader);
}

StickyHeader::StickyHeader(sticky::protocol::HttpHandler next, StickyHeaderOptions options)
    : next_(std::move(next)), options_(std::move(options)) {}

void StickyHeader::serveHttp(ResponseWriter& w, const HttpRequest& req) const {
    const AffinityRequestState state = InspectRequest(req);
    BackendHeaderWriter writer(w, state.backendFromQuery, options_);

    if (!next_) {
        LOG_WARN << "StickyHeader: no next handler for " << req.methodString() << " " << req.path();
        writer.writeHeader(404);
        return;
    }

    if (state.backendFromQuery.empty()) {
        next_(writer, req);
    } else {
        LOG_DEBUG << "StickyHeader: no affinity cookie, using query backend " << state.backendFromQuery;
        const HttpRequest augmented = req.withAddedCookie(kBackendCookie, state.backendFromQuery);
        next_(writer, augmented);
    }

    writer.finish();
}

sticky::protocol::HttpHandler StickyHeader::asHandler() const {
    StickyHeader self(*this);
    return [self](ResponseWriter& w, const HttpRequest& req) { self.serveHttp(w, req); };
}

} // namespace middleware
} // namespace sticky
