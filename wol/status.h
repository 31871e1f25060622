#ifndef WOL_STATUS_H
#define WOL_STATUS_H

#include <string>

namespace wol {

enum class errc {
    ok = 0,
    invalid_mac_length,
    invalid_mac_format,
    invalid_packet,
    send_failure,
};

// Where status::error comes from.
enum class origin {
    none,
    system,    // errno
    resolver,  // getaddrinfo EAI_* code
};

struct status {
    errc code;
    origin source;
    int error;
    const char* op;

    bool ok() const { return code == errc::ok; }
};

inline status success() { return status{errc::ok, origin::none, 0, nullptr}; }
inline status failure(errc code) { return status{code, origin::none, 0, nullptr}; }

// Transport failure: captures errno for the step that failed.
status system_failure(const char* op);
status resolver_failure(int eai_code);

const char* describe(errc code);
std::string to_string(const status& st);

}  // namespace wol

#endif  // WOL_STATUS_H
