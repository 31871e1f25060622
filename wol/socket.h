#ifndef WOL_SOCKET_H
#define WOL_SOCKET_H

namespace wol {

// Owns a socket descriptor and closes it when it goes out of scope.
class socket {
public:
    socket() : fd_(-1) {}
    explicit socket(int fd) : fd_(fd) {}
    ~socket() { close(); }

    socket(socket&& other) noexcept : fd_(other.release()) {}
    socket& operator=(socket&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.release();
        }
        return *this;
    }

    socket(const socket&) = delete;
    socket& operator=(const socket&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void close() noexcept;

private:
    int fd_;
};

}  // namespace wol

#endif  // WOL_SOCKET_H
