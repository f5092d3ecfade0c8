#pragma once

namespace vaultwire::methods {

    inline constexpr const char* CreateUser     = "create_user";
    inline constexpr const char* LoginRequest   = "login_request";
    inline constexpr const char* LoginTest      = "login_test";
    inline constexpr const char* GetSources     = "get_sources";
    inline constexpr const char* GetPassword    = "get_password";
    inline constexpr const char* SetPassword    = "set_password";
    inline constexpr const char* DeletePassword = "delete_password";
    inline constexpr const char* DeleteUser     = "delete_user";

}

namespace vaultwire::headers {

    inline constexpr const char* Method        = "Method";
    inline constexpr const char* Session       = "Session";
    inline constexpr const char* ContentType   = "Content-Type";
    inline constexpr const char* ContentLength = "Content-Length";

}

namespace vaultwire::content_types {

    inline constexpr const char* Json  = "json";
    inline constexpr const char* Ascii = "ascii";
    inline constexpr const char* Bytes = "bytes";

}
