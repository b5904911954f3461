#ifndef REQUEST_T_H
#define REQUEST_T_H

namespace request_t {
    enum request_t {
        GET,
        POST,
        PUT,
        DELETE,
        PATCH
    };
}

#endif // REQUEST_T_H
