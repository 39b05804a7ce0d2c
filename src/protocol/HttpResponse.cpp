#include "sticky/protocol/HttpResponse.h"
#include "sticky/common/Logger.h"

#include <stdio.h>
#include <cstring>

namespace sticky {
namespace protocol {

const char* HttpResponse::ReasonPhrase(int statusCode) {
    switch (statusCode) {
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "";
    }
}

void HttpResponse::writeHeader(int statusCode) {
    if (wroteHeader_) {
        LOG_WARN << "HttpResponse: superfluous writeHeader(" << statusCode
                 << "), status already " << statusCode_;
        return;
    }
    wroteHeader_ = true;
    statusCode_ = statusCode;
    if (statusMessage_.empty()) statusMessage_ = ReasonPhrase(statusCode);
    sentHeaders_ = headers_;
}

size_t HttpResponse::write(const char* data, size_t len) {
    if (!wroteHeader_) writeHeader(k200Ok);
    body_.append(data, len);
    return len;
}

bool HttpResponse::flush() {
    if (!wroteHeader_) writeHeader(k200Ok);
    ++flushCount_;
    return true;
}

void HttpResponse::appendToBuffer(sticky::network::Buffer* output) const {
    char buf[32];
    snprintf(buf, sizeof buf, "HTTP/1.1 %d ", wroteHeader_ ? statusCode_ : static_cast<int>(k200Ok));
    output->Append(buf, strlen(buf));
    output->Append(statusMessage_.empty() ? ReasonPhrase(k200Ok) : statusMessage_);
    output->Append("\r\n");

    if (closeConnection_) {
        output->Append("Connection: close\r\n");
    } else {
        snprintf(buf, sizeof buf, "Content-Length: %zu\r\n", body_.size());
        output->Append(buf, strlen(buf));
        output->Append("Connection: Keep-Alive\r\n");
    }

    for (const auto& field : resultHeaders()) {
        output->Append(field.first);
        output->Append(": ");
        output->Append(HttpHeaders::WireValue(field.second));
        output->Append("\r\n");
    }

    output->Append("\r\n");
    output->Append(body_);
}

} // namespace protocol
} // namespace sticky
