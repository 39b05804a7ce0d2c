#include "sticky/network/Socket.h"
#include "sticky/common/Logger.h"

#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace sticky {
namespace network {

Socket::~Socket() {
    if (sockfd_ >= 0 && ::close(sockfd_) != 0) {
        LOG_ERROR << "Socket::~Socket close(" << sockfd_ << "): " << std::strerror(errno);
    }
}

} // namespace network
} // namespace sticky
