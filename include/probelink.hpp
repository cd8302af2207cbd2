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
 * @file probelink.hpp
 * @brief probelink - in-process profiler link over a unix-domain socket
 *
 * Embeds in a host process, listens on <dir>/<prefix><pid> and serves one
 * external profiling client at a time. Traffic is little-endian frames with
 * a 7-byte header, routed to registered components at a fixed tick rate.
 *
 * Usage:
 *   #include "probelink.hpp"
 *
 *   int main() {
 *     probelink::Server server;
 *     server.register_component(std::make_shared<MyComponent>());
 *     server.initialize();
 *     server.start();
 *     ...
 *     server.stop();
 *   }
 */

#ifndef PROBELINK_HPP_
#define PROBELINK_HPP_

#include "probelink/byte_buffer.hpp"
#include "probelink/cancellation.hpp"
#include "probelink/component.hpp"
#include "probelink/config.hpp"
#include "probelink/connection.hpp"
#include "probelink/control_component.hpp"
#include "probelink/dispatcher.hpp"
#include "probelink/frame_codec.hpp"
#include "probelink/handshake.hpp"
#include "probelink/heartbeat.hpp"
#include "probelink/log.hpp"
#include "probelink/server.hpp"
#include "probelink/stats.hpp"
#include "probelink/vocabulary.hpp"

#endif  // PROBELINK_HPP_
