#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "sticky/protocol/HttpHeaders.h"
#include "sticky/network/Socket.h"

namespace sticky {
namespace protocol {

class HttpRequest;

// Optional capability: push bytes written so far to the client.
class Flusher {
public:
    virtual ~Flusher() = default;
    // false if the bytes could not be delivered.
    virtual bool flush() = 0;
};

// Optional capability: take the connection over (e.g. after a protocol
// upgrade). After a successful hijack the writer must not be used again;
// returns nullptr if the connection cannot be handed out.
class Hijacker {
public:
    virtual ~Hijacker() = default;
    virtual std::unique_ptr<sticky::network::Socket> hijack() = 0;
};

// Sink for one HTTP response. header() may be changed until the status is
// written; writeHeader() sends the status line and the header block;
// write() without a prior writeHeader() implies status 200.
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    virtual HttpHeaders& header() = 0;
    virtual void writeHeader(int statusCode) = 0;
    // Returns the number of bytes accepted.
    virtual size_t write(const char* data, size_t len) = 0;

    size_t write(const std::string& data) { return write(data.data(), data.size()); }

    // nullptr when the capability is not supported.
    virtual Flusher* tryGetFlusher() { return nullptr; }
    virtual Hijacker* tryGetHijacker() { return nullptr; }
};

using HttpHandler = std::function<void(ResponseWriter&, const HttpRequest&)>;

} // namespace protocol
} // namespace sticky
