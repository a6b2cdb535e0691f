#pragma once

// ---------------------------------------------------------------------------------------------
// wisp: X11 windows driven from a dedicated UI thread, delivering their events through
// receivers.
//
//    wisp::EventReceiver rx;
//    auto w = wisp::Window::builder(rx).title("hello").build();
//    while (auto ev = rx.recv()) { ... }
//    wisp::UiThread::join();
// ---------------------------------------------------------------------------------------------
#include "channel.hpp"
#include "config.hpp"
#include "error.hpp"
#include "event.hpp"
#include "geometry.hpp"
#include "handle.hpp"
#include "receiver.hpp"
#include "style.hpp"
#include "ui_thread.hpp"
#include "utils.hpp"
#include "window.hpp"
