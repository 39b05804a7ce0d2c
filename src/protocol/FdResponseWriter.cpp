#include "sticky/protocol/FdResponseWriter.h"
#include "sticky/protocol/HttpResponse.h"
#include "sticky/common/Logger.h"

#include <cstring>
#include <string>

namespace sticky {
namespace protocol {

FdResponseWriter::FdResponseWriter(std::unique_ptr<sticky::network::Socket> socket)
    : socket_(std::move(socket)) {}

FdResponseWriter::~FdResponseWriter() {
    if (socket_ && output_.ReadableBytes() > 0) {
        LOG_WARN << "FdResponseWriter destroyed with " << output_.ReadableBytes()
                 << " unflushed bytes on fd " << socket_->fd();
    }
}

void FdResponseWriter::writeHeader(int statusCode) {
    if (!socket_) {
        LOG_ERROR << "FdResponseWriter: writeHeader(" << statusCode << ") after hijack";
        return;
    }
    if (wroteHeader_) {
        LOG_WARN << "FdResponseWriter: superfluous writeHeader(" << statusCode << ")";
        return;
    }
    wroteHeader_ = true;
    statusCode_ = statusCode;

    output_.Append("HTTP/1.1 " + std::to_string(statusCode) + " ");
    output_.Append(HttpResponse::ReasonPhrase(statusCode));
    output_.Append("\r\n");
    for (const auto& field : headers_) {
        output_.Append(field.first);
        output_.Append(": ");
        output_.Append(HttpHeaders::WireValue(field.second));
        output_.Append("\r\n");
    }
    if (!headers_.has("Connection")) output_.Append("Connection: close\r\n");
    output_.Append("\r\n");
}

size_t FdResponseWriter::write(const char* data, size_t len) {
    if (!socket_) {
        LOG_ERROR << "FdResponseWriter: write after hijack";
        return 0;
    }
    if (!wroteHeader_) writeHeader(HttpResponse::k200Ok);
    output_.Append(data, len);
    if (output_.ReadableBytes() >= kHighWaterMark && !flush()) {
        return 0;
    }
    return len;
}

bool FdResponseWriter::flush() {
    if (!socket_) {
        LOG_ERROR << "FdResponseWriter: flush after hijack";
        return false;
    }
    if (!wroteHeader_) writeHeader(HttpResponse::k200Ok);

    int savedErrno = 0;
    if (output_.WriteFd(socket_->fd(), &savedErrno) < 0) {
        LOG_ERROR << "FdResponseWriter: write to fd " << socket_->fd() << " failed: "
                  << std::strerror(savedErrno);
        return false;
    }
    return true;
}

bool FdResponseWriter::finish() {
    if (!socket_) return true;
    return flush();
}

std::unique_ptr<sticky::network::Socket> FdResponseWriter::hijack() {
    if (!socket_) {
        LOG_ERROR << "FdResponseWriter: connection already hijacked";
        return nullptr;
    }
    if (output_.ReadableBytes() > 0) {
        int savedErrno = 0;
        if (output_.WriteFd(socket_->fd(), &savedErrno) < 0) {
            LOG_ERROR << "FdResponseWriter: flushing before hijack failed: " << std::strerror(savedErrno);
            return nullptr;
        }
    }
    LOG_DEBUG << "FdResponseWriter: handing over fd " << socket_->fd();
    return std::move(socket_);
}

} // namespace protocol
} // namespace sticky
