#include "sticky/middleware/StickyHeader.h"
#include "sticky/protocol/HttpContext.h"
#include "sticky/protocol/FdResponseWriter.h"
#include "sticky/protocol/Cookie.h"
#include "sticky/network/Buffer.h"
#include "sticky/network/Socket.h"
#include "sticky/common/Logger.h"
#include "sticky/common/Config.h"

#include <fcntl.h>
#include <getopt.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

namespace {

// Reads until one complete request is parsed or input ends.
bool ReadRequest(int fd, sticky::protocol::HttpContext* context) {
    sticky::network::Buffer buf;
    while (true) {
        if (!context->parseRequest(&buf)) return false;
        if (context->gotAll()) return true;

        int savedErrno = 0;
        const ssize_t n = buf.ReadFd(fd, &savedErrno);
        if (n < 0) {
            LOG_ERROR << "read request: " << std::strerror(savedErrno);
            return false;
        }
        if (n == 0) {
            if (!context->parseRequest(&buf)) return false;
            if (!context->gotAll()) LOG_ERROR << "read request: truncated input";
            return context->gotAll();
        }
    }
}

// Stands in for the load balancer: pins new clients to the configured
// backend via the affinity cookie and answers with a fixed response.
sticky::protocol::HttpHandler MakeUpstream(const sticky::common::Config& conf) {
    const std::string stickyBackend = conf.GetString("upstream", "sticky_backend", "");
    const int status = conf.GetInt("upstream", "status", 200);
    const std::string body = conf.GetString("upstream", "body", "");

    return [stickyBackend, status, body](sticky::protocol::ResponseWriter& w,
                                         const sticky::protocol::HttpRequest& req) {
        auto pinned = req.cookie(sticky::middleware::kBackendCookie);
        if (pinned) {
            LOG_INFO << "upstream: request pinned to " << *pinned;
        } else if (!stickyBackend.empty()) {
            sticky::protocol::Cookie cookie(sticky::middleware::kBackendCookie, stickyBackend);
            cookie.path = "/";
            w.header().add("Set-Cookie", cookie.toSetCookieString());
            LOG_INFO << "upstream: pinning client to " << stickyBackend;
        }
        if (!body.empty()) w.header().set("Content-Type", "text/plain");
        w.writeHeader(status);
        if (!body.empty()) w.write(body);
    };
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace sticky;

    std::string configFile;
    std::string requestFile;
    int ch;
    while ((ch = getopt(argc, argv, "c:f:h")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'f':
                requestFile = optarg;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-f request_file]\n", argv[0]);
                printf("  Reads one raw HTTP/1.1 request (stdin by default), runs it through\n");
                printf("  the sticky header middleware and prints the response.\n");
                return ch == 'h' ? 0 : 1;
        }
    }

    auto& conf = common::Config::Instance();
    if (!configFile.empty() && !conf.Load(configFile)) {
        LOG_ERROR << "Failed to load config, using defaults.";
    }
    common::Logger::Instance().SetLevel(
        common::Logger::Instance().ParseLevel(conf.GetString("global", "log_level", "INFO")));
    common::Logger::Instance().SetColored(
        conf.GetBool("global", "log_color", ::isatty(STDERR_FILENO) == 1));

    int inFd = STDIN_FILENO;
    std::unique_ptr<network::Socket> inFile;
    if (!requestFile.empty()) {
        const int fd = ::open(requestFile.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            LOG_ERROR << "open " << requestFile << ": " << std::strerror(errno);
            return 1;
        }
        inFile = std::make_unique<network::Socket>(fd);
        inFd = fd;
    }

    protocol::HttpContext context;
    if (!ReadRequest(inFd, &context)) {
        LOG_ERROR << "Malformed HTTP request";
        return 2;
    }
    const protocol::HttpRequest& req = context.request();
    LOG_INFO << "Replaying " << req.methodString() << " " << req.path()
             << (req.query().empty() ? "" : "?") << req.query();

    const int outFd = ::dup(STDOUT_FILENO);
    if (outFd < 0) {
        LOG_ERROR << "dup stdout: " << std::strerror(errno);
        return 1;
    }
    protocol::FdResponseWriter writer(std::make_unique<network::Socket>(outFd));

    middleware::StickyHeader stickyHeader(MakeUpstream(conf), middleware::StickyHeaderOptions::FromConfig(conf));
    stickyHeader.serveHttp(writer, req);

    if (!writer.finish()) {
        LOG_ERROR << "Failed to write response";
        return 1;
    }
    return 0;
}
