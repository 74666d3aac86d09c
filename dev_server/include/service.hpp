#pragma once

#include <optional>
#include <string>

#include "storage.hpp"
#include "types.h"

namespace httplib {
class Server;
}

// transfer.sh compatible routes:
//   PUT    /<name>                         -> body "<base>/<token>/<name>", X-Url-Delete header
//   GET    /<token>/<name>                 -> file, counts a download
//   HEAD   /<token>/<name>                 -> headers only
//   DELETE /<token>/<name>/<delete token>  -> 200 or 404
class HostingService {
   public:
    HostingService(Storage& storage, std::optional<Credentials> auth);

    // Installs routes, request/error loggers and the error handlers.
    void mount(httplib::Server& server);

    static std::string generate_token(std::size_t length);

   private:
    Storage& m_storage;
    std::optional<Credentials> m_auth;
};
