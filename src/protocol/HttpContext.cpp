#include "sticky/protocol/HttpContext.h"
#include "sticky/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace sticky {
namespace protocol {

static std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

static const char* FindCrlf(const sticky::network::Buffer* buf) {
    static const char kCrlf[] = "\r\n";
    const char* end = buf->BeginWrite();
    const char* crlf = std::search(buf->Peek(), end, kCrlf, kCrlf + 2);
    return crlf == end ? nullptr : crlf;
}

void HttpContext::reset() {
    state_ = kExpectRequestLine;
    HttpRequest dummy;
    request_.swap(dummy);
    chunked_ = false;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;
}

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    bool succeed = false;
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space != end && request_.setMethod(start, space)) {
        start = space + 1;
        space = std::find(start, end, ' ');
        if (space != end) {
            const char* question = std::find(start, space, '?');
            if (question != space) {
                request_.setPath(start, question);
                request_.setQuery(question + 1, space);
            } else {
                request_.setPath(start, space);
            }
            start = space + 1;
            succeed = end - start == 8 && std::equal(start, end - 1, "HTTP/1.");
            if (succeed) {
                if (*(end - 1) == '1') {
                    request_.setVersion(HttpRequest::kHttp11);
                } else if (*(end - 1) == '0') {
                    request_.setVersion(HttpRequest::kHttp10);
                } else {
                    succeed = false;
                }
            }
        }
    }
    return succeed;
}

bool HttpContext::processEndOfHeaders() {
    chunked_ = false;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;

    const std::string te = request_.getHeader("Transfer-Encoding");
    if (!te.empty() && ToLowerCopy(te).find("chunked") != std::string::npos) {
        chunked_ = true;
    } else {
        const std::string cl = request_.getHeader("Content-Length");
        if (!cl.empty()) {
            errno = 0;
            char* endp = nullptr;
            long long v = std::strtoll(cl.c_str(), &endp, 10);
            if (endp == cl.c_str() || *endp != '\0' || v < 0 || errno == ERANGE) {
                LOG_DEBUG << "HttpContext: bad Content-Length '" << cl << "'";
                return false;
            }
            bodyRemaining_ = static_cast<size_t>(v);
        }
    }

    state_ = (chunked_ || bodyRemaining_ > 0) ? kExpectBody : kGotAll;
    return true;
}

bool HttpContext::consumeChunked(sticky::network::Buffer* buf, bool* hasMore) {
    while (true) {
        if (expectingChunkSize_) {
            const char* crlf = FindCrlf(buf);
            if (!crlf) {
                *hasMore = false;
                return true;
            }
            std::string line(buf->Peek(), crlf);
            buf->Retrieve(crlf + 2 - buf->Peek());

            // Strip chunk extensions.
            auto semi = line.find(';');
            if (semi != std::string::npos) line = line.substr(0, semi);
            while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.pop_back();
            size_t i = 0;
            while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
            line = line.substr(i);

            if (line.empty()) return false;
            errno = 0;
            char* endp = nullptr;
            long long sz = std::strtoll(line.c_str(), &endp, 16);
            if (endp == line.c_str() || *endp != '\0' || sz < 0 || errno == ERANGE) {
                LOG_DEBUG << "HttpContext: bad chunk size '" << line << "'";
                return false;
            }
            chunkSize_ = static_cast<size_t>(sz);
            expectingChunkSize_ = false;

            if (chunkSize_ == 0) continue;
        }

        if (chunkSize_ == 0) {
            // Last chunk seen; skip trailers up to and including the empty line.
            const char* t = FindCrlf(buf);
            if (!t) {
                *hasMore = false;
                return true;
            }
            const bool emptyLine = (t == buf->Peek());
            buf->Retrieve(t + 2 - buf->Peek());
            if (emptyLine) {
                state_ = kGotAll;
                *hasMore = false;
                return true;
            }
            continue;
        }

        // Need chunkSize_ bytes + CRLF.
        if (buf->ReadableBytes() < chunkSize_ + 2) {
            *hasMore = false;
            return true;
        }
        request_.appendBody(buf->Peek(), chunkSize_);
        buf->Retrieve(chunkSize_);
        const char* p = buf->Peek();
        if (p[0] != '\r' || p[1] != '\n') return false;
        buf->Retrieve(2);
        expectingChunkSize_ = true;
    }
}

// return false if any error
bool HttpContext::parseRequest(sticky::network::Buffer* buf) {
    bool hasMore = true;
    while (hasMore) {
        if (state_ == kExpectRequestLine) {
            const char* crlf = FindCrlf(buf);
            if (!crlf) break;
            if (!processRequestLine(buf->Peek(), crlf)) {
                LOG_DEBUG << "HttpContext: bad request line";
                return false;
            }
            buf->Retrieve(crlf + 2 - buf->Peek());
            state_ = kExpectHeaders;
        } else if (state_ == kExpectHeaders) {
            const char* crlf = FindCrlf(buf);
            if (!crlf) break;
            if (crlf == buf->Peek()) {
                // empty line, end of headers
                buf->Retrieve(2);
                if (!processEndOfHeaders()) return false;
                continue;
            }
            const char* colon = std::find(buf->Peek(), crlf, ':');
            if (colon == crlf) {
                LOG_DEBUG << "HttpContext: header line without ':'";
                return false;
            }
            request_.addHeader(buf->Peek(), colon, crlf);
            buf->Retrieve(crlf + 2 - buf->Peek());
        } else if (state_ == kExpectBody) {
            if (chunked_) {
                if (!consumeChunked(buf, &hasMore)) {
                    LOG_DEBUG << "HttpContext: bad chunked body";
                    return false;
                }
            } else {
                const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
                if (n > 0) {
                    request_.appendBody(buf->Peek(), n);
                    buf->Retrieve(n);
                    bodyRemaining_ -= n;
                }
                if (bodyRemaining_ == 0) state_ = kGotAll;
                hasMore = false;
            }
        } else {
            hasMore = false;
        }
    }
    return true;
}

} // namespace protocol
} // namespace sticky
