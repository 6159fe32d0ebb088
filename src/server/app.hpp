/*
 * app.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Crow application type with the security middleware stack

**************************************************/

#ifndef RAMPART_SERVER_APP_HPP
#define RAMPART_SERVER_APP_HPP

#include <crow.h>
#include <crow/middlewares/cookie_parser.h>

#include "middleware/security.hpp"

namespace rampart::server {

/**
 * @brief Central HTTP application type with middleware stack
 *
 * Middleware execution order (before_handle):
 *   1. CookieParser - Parse the session cookie
 *   2. RequestLogger - Log request timing
 *   3. SecurityGuard - Host, CSRF and body checks
 *
 * Note: after_handle runs in reverse order, so security headers are in
 * place before the request is logged and cookies are written.
 */
using ServerApp = crow::App<crow::CookieParser, middleware::RequestLogger,
                            middleware::SecurityGuard>;

}  // namespace rampart::server

#endif  // RAMPART_SERVER_APP_HPP
