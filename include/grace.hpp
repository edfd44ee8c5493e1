/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file grace.hpp
 * @brief GRACE - graceful shutdown primitives for TCP listeners
 *
 * Stop accepting without racing the accepting thread, tell an intentional
 * close apart from a real accept failure, and record each connection's last
 * protocol state so the owning server can decide when it has drained.
 *
 * Usage:
 *   #include "grace.hpp"
 *
 *   int main() {
 *     grace::ListenConfig cfg;
 *     cfg.port = 8080;
 *     auto listener = grace::listen_graceful(cfg);
 *     // from a shutdown thread: listener->close();
 *     for (;;) {
 *       auto conn = listener->accept_tracked();
 *       if (!conn) {
 *         if (conn.get_error().is_closed_after_shutdown()) break;
 *         continue;
 *       }
 *       // hand std::move(conn.value()) to a worker
 *     }
 *   }
 */

#ifndef GRACE_HPP_
#define GRACE_HPP_

#include "grace/conn.hpp"
#include "grace/conn_state.hpp"
#include "grace/graceful.hpp"
#include "grace/keepalive.hpp"
#include "grace/listener.hpp"
#include "grace/log.hpp"
#include "grace/tcp.hpp"
#include "grace/tracked_conn.hpp"
#include "grace/vocabulary.hpp"

#endif  // GRACE_HPP_
