#include "sticky/network/Buffer.h"

#include <errno.h>
#include <sys/uio.h>
#include <unistd.h>

namespace sticky {
namespace network {

ssize_t Buffer::ReadFd(int fd, int* savedErrno) {
    char extrabuf[65536];
    struct iovec vec[2];
    const size_t writable = WritableBytes();
    vec[0].iov_base = Begin() + writerIndex_;
    vec[0].iov_len = writable;
    vec[1].iov_base = extrabuf;
    vec[1].iov_len = sizeof extrabuf;
    // when there is enough space in this buffer, don't read into extrabuf.
    const int iovcnt = (writable < sizeof extrabuf) ? 2 : 1;
    ssize_t n;
    do {
        n = ::readv(fd, vec, iovcnt);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        *savedErrno = errno;
    } else if (static_cast<size_t>(n) <= writable) {
        writerIndex_ += n;
    } else {
        writerIndex_ = buffer_.size();
        Append(extrabuf, n - writable);
    }
    return n;
}

ssize_t Buffer::WriteFd(int fd, int* savedErrno) {
    ssize_t total = 0;
    while (ReadableBytes() > 0) {
        const ssize_t n = ::write(fd, Peek(), ReadableBytes());
        if (n < 0) {
            if (errno == EINTR) continue;
            *savedErrno = errno;
            return -1;
        }
        Retrieve(static_cast<size_t>(n));
        total += n;
    }
    return total;
}

} // namespace network
} // namespace sticky
