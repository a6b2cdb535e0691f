#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <X11/Xlib.h>

#include "geometry.hpp"
#include "handle.hpp"

namespace wisp {
class Procedure;
}

namespace wisp::ime {

// ---------------------------------------------------------------------------------------------
// The input method collaborator. The UI thread calls `init` before its loop starts and
// `shutdown` on every termination path; `shutdown` may be called more than once.
// ---------------------------------------------------------------------------------------------
class TextService {
public:
   virtual ~TextService() = default;

   virtual void init(::Display* dpy) = 0;
   virtual void shutdown()           = 0;
   virtual bool is_active() const    = 0;
};

// ---------------------------------------------------------------------------------------------
// One XIC per window. Preedit callbacks are routed to the dispatch procedure.
// ---------------------------------------------------------------------------------------------
class InputContext {
public:
   struct CallbackData {
      Procedure*   proc = nullptr;
      WindowHandle handle;
   };

   InputContext(XIC ic, std::unique_ptr<CallbackData> data, std::weak_ptr<void> xim_alive)
      : _ic(ic)
      , _data(std::move(data))
      , _xim_alive(std::move(xim_alive)) {}

   InputContext(const InputContext&)            = delete;
   InputContext& operator=(const InputContext&) = delete;
   ~InputContext();

   XIC  ic() const { return _ic; }
   void set_focus(bool focused);
   void set_spot(PhysicalPosition<int> pos);
   void reset(); // cancels the composition in progress

private:
   XIC                           _ic = nullptr;
   std::unique_ptr<CallbackData> _data;
   std::weak_ptr<void>           _xim_alive; // XDestroyIC is invalid once the XIM is closed
};

// ---------------------------------------------------------------------------------------------
class XimService : public TextService {
public:
   XimService() = default;
   ~XimService() override { shutdown(); }

   void init(::Display* dpy) override;
   void shutdown() override;
   bool is_active() const override { return !!_xim; }

   // nullptr when no input method is available
   std::shared_ptr<InputContext> create_context(::Window w, WindowHandle h, Procedure& proc);

private:
   ::Display*            _dpy = nullptr;
   XIM                   _xim = nullptr;
   bool                  _callbacks_supported = false;
   std::shared_ptr<char> _alive;
};

// ---------------------------------------------------------------------------------------------
std::string    to_utf8(std::u32string_view s);
std::string    to_utf8(char32_t c);
std::u32string from_utf8(std::string_view s);

} // namespace wisp::ime
