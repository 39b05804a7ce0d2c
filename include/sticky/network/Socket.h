#pragma once

#include "sticky/common/noncopyable.h"

namespace sticky {
namespace network {

// Owns a connected stream descriptor and closes it on destruction.
class Socket : sticky::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

private:
    int sockfd_;
};

} // namespace network
} // namespace sticky
