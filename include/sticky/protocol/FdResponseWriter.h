#pragma once

#include <memory>

#include "sticky/protocol/ResponseWriter.h"
#include "sticky/network/Buffer.h"
#include "sticky/network/Socket.h"
#include "sticky/common/noncopyable.h"

namespace sticky {
namespace protocol {

// Streams an HTTP/1.1 response onto a descriptor it owns. The body is
// close-delimited (Connection: close). Output is staged in a buffer and
// written out on flush(), once kHighWaterMark bytes are pending, and on
// finish(). Supports connection takeover.
class FdResponseWriter : public ResponseWriter,
                         public Flusher,
                         public Hijacker,
                         sticky::common::noncopyable {
public:
    static const size_t kHighWaterMark = 64 * 1024;

    explicit FdResponseWriter(std::unique_ptr<sticky::network::Socket> socket);
    ~FdResponseWriter() override;

    HttpHeaders& header() override { return headers_; }
    void writeHeader(int statusCode) override;
    size_t write(const char* data, size_t len) override;
    using ResponseWriter::write;

    bool flush() override;
    std::unique_ptr<sticky::network::Socket> hijack() override;

    Flusher* tryGetFlusher() override { return this; }
    Hijacker* tryGetHijacker() override { return this; }

    // Writes the status (200 if none yet) and any pending bytes.
    bool finish();

    bool wroteHeader() const { return wroteHeader_; }
    bool hijacked() const { return !socket_; }
    int statusCode() const { return statusCode_; }

private:
    std::unique_ptr<sticky::network::Socket> socket_;
    HttpHeaders headers_;
    sticky::network::Buffer output_;
    int statusCode_{0};
    bool wroteHeader_{false};
};

} // namespace protocol
} // namespace sticky
