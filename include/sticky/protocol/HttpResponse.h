#pragma once

#include <string>

#include "sticky/protocol/ResponseWriter.h"
#include "sticky/network/Buffer.h"

namespace sticky {
namespace protocol {

// In-memory response: records what a handler writes so it can be inspected
// or serialized afterwards. Supports flushing (counted), not takeover.
class HttpResponse : public ResponseWriter, public Flusher {
public:
    enum HttpStatusCode {
        kUnknown,
        k101SwitchingProtocols = 101,
        k200Ok = 200,
        k204NoContent = 204,
        k301MovedPermanently = 301,
        k302Found = 302,
        k400BadRequest = 400,
        k404NotFound = 404,
        k500InternalServerError = 500,
        k502BadGateway = 502,
        k503ServiceUnavailable = 503,
    };

    explicit HttpResponse(bool close = true)
        : statusCode_(kUnknown), closeConnection_(close) {}

    HttpHeaders& header() override { return headers_; }
    void writeHeader(int statusCode) override;
    size_t write(const char* data, size_t len) override;
    using ResponseWriter::write;

    bool flush() override;
    Flusher* tryGetFlusher() override { return this; }

    bool wroteHeader() const { return wroteHeader_; }
    int statusCode() const { return statusCode_; }

    // Headers as they were when the status was written; the live map if
    // the status has not been written yet.
    const HttpHeaders& resultHeaders() const { return wroteHeader_ ? sentHeaders_ : headers_; }
    const std::string& body() const { return body_; }
    int flushCount() const { return flushCount_; }

    void appendToBuffer(sticky::network::Buffer* output) const;

    static const char* ReasonPhrase(int statusCode);

private:
    int statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    bool wroteHeader_{false};
    int flushCount_{0};
    HttpHeaders headers_;
    HttpHeaders sentHeaders_;
    std::string body_;
};

} // namespace protocol
} // namespace sticky
