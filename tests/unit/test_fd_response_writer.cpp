#include "sticky/protocol/FdResponseWriter.h"
#include "sticky/network/Buffer.h"
#include "sticky/network/Socket.h"
#include "sticky/common/Logger.h"

#include <sys/socket.h>
#include <csignal>
#include <unistd.h>
#include <fcntl.h>
#include <iostream>
#include <memory>
#include <string>

using namespace sticky;

static int Fail(const std::string& msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return 1;
}

// Everything currently readable on fd (non-blocking).
static std::string Drain(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    network::Buffer buf;
    int savedErrno = 0;
    while (buf.ReadFd(fd, &savedErrno) > 0) {
    }
    ::fcntl(fd, F_SETFL, flags);
    return buf.RetrieveAllAsString();
}

static int testStreamingAndFlush() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) return Fail("socketpair");
    network::Socket peer(fds[1]);

    protocol::FdResponseWriter writer(std::make_unique<network::Socket>(fds[0]));
    if (!writer.tryGetFlusher() || !writer.tryGetHijacker()) return Fail("capabilities missing");

    writer.header().set("X-Traefik-Backend", "http://1.2.3.4");
    writer.header().add("Set-Cookie", "_TRAEFIK_BACKEND=http://1.2.3.4; Path=/");
    writer.writeHeader(200);
    writer.write("chunk-1");

    // Nothing leaves before a flush.
    if (!Drain(peer.fd()).empty()) return Fail("bytes sent before flush");

    if (!writer.flush()) return Fail("flush failed");
    const std::string first = Drain(peer.fd());
    const std::string expected =
        "HTTP/1.1 200 OK\r\n"
        "X-Traefik-Backend: http://1.2.3.4\r\n"
        "Set-Cookie: _TRAEFIK_BACKEND=http://1.2.3.4; Path=/\r\n"
        "Connection: close\r\n"
        "\r\n"
        "chunk-1";
    if (first != expected) return Fail("unexpected first flush: " + first);

    writer.write("chunk-2");
    if (!writer.finish()) return Fail("finish failed");
    if (Drain(peer.fd()) != "chunk-2") return Fail("second chunk missing");
    return 0;
}

static int testImplicitStatusOnFlush() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) return Fail("socketpair");
    network::Socket peer(fds[1]);

    protocol::FdResponseWriter writer(std::make_unique<network::Socket>(fds[0]));
    if (!writer.flush()) return Fail("flush failed");
    if (!writer.wroteHeader() || writer.statusCode() != 200) return Fail("flush should imply 200");
    if (Drain(peer.fd()).find("HTTP/1.1 200 OK\r\n") != 0) return Fail("status line missing");
    return 0;
}

static int testHijack() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) return Fail("socketpair");
    network::Socket peer(fds[1]);

    protocol::FdResponseWriter writer(std::make_unique<network::Socket>(fds[0]));
    writer.header().set("Upgrade", "websocket");
    writer.header().set("Connection", "Upgrade");
    writer.writeHeader(101);

    std::unique_ptr<network::Socket> conn = writer.hijack();
    if (!conn) return Fail("hijack failed");
    if (conn->fd() != fds[0]) return Fail("hijack returned another descriptor");
    if (!writer.hijacked()) return Fail("writer should report hijacked");

    // Pending header bytes were pushed out before the handover.
    const std::string upgrade = Drain(peer.fd());
    if (upgrade.find("HTTP/1.1 101 Switching Protocols\r\n") != 0) return Fail("101 not flushed: " + upgrade);
    if (upgrade.find("Connection: close") != std::string::npos) return Fail("Connection header duplicated");

    if (writer.hijack()) return Fail("second hijack should fail");
    if (writer.write("x") != 0) return Fail("write after hijack should fail");
    if (writer.flush()) return Fail("flush after hijack should fail");
    if (!writer.finish()) return Fail("finish after hijack is a no-op");

    // The taken-over connection is usable directly.
    const std::string frame = "raw-frame";
    if (::write(conn->fd(), frame.data(), frame.size()) != static_cast<ssize_t>(frame.size())) {
        return Fail("write on hijacked connection");
    }
    if (Drain(peer.fd()) != frame) return Fail("raw frame not received");
    return 0;
}

static int testFlushErrorReported() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) return Fail("socketpair");
    ::close(fds[1]);

    protocol::FdResponseWriter writer(std::make_unique<network::Socket>(fds[0]));
    writer.writeHeader(200);
    if (writer.flush()) return Fail("flush to a closed peer should fail");
    return 0;
}

int main() {
    common::Logger::Instance().SetLevel(common::LogLevel::FATAL);
    // A write to a closed peer must surface as EPIPE, not kill the test.
    ::signal(SIGPIPE, SIG_IGN);

    if (int rc = testStreamingAndFlush()) return rc;
    if (int rc = testImplicitStatusOnFlush()) return rc;
    if (int rc = testHijack()) return rc;
    if (int rc = testFlushErrorReported()) return rc;

    std::cout << "PASS\n";
    return 0;
}
