#include "wol/socket.h"

#include <unistd.h>

namespace wol {

void socket::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace wol
