#pragma once

#include "sticky/protocol/HttpRequest.h"
#include "sticky/network/Buffer.h"

namespace sticky {
namespace protocol {

// Incremental HTTP/1.x request parser. Feed it whatever bytes have arrived;
// it consumes complete lines and body bytes from the buffer.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    HttpContext()
        : state_(kExpectRequestLine) {}

    // return false if some error
    bool parseRequest(sticky::network::Buffer* buf);

    bool gotAll() const { return state_ == kGotAll; }
    void reset();

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool processEndOfHeaders();
    // false on malformed chunk framing; *hasMore tells whether to keep looping
    bool consumeChunked(sticky::network::Buffer* buf, bool* hasMore);

    HttpRequestParseState state_;
    HttpRequest request_;

    // Body parsing state
    bool chunked_{false};
    size_t bodyRemaining_{0};
    size_t chunkSize_{0};
    bool expectingChunkSize_{true};
};

} // namespace protocol
} // namespace sticky
