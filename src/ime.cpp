#include "ime.hpp"
#include "procedure.hpp"
#include "utils.hpp"

#include <clocale>

namespace wisp::ime {

// ---------------------------------------------------------------------------------------------
//                              utf-8
// ---------------------------------------------------------------------------------------------
std::string to_utf8(char32_t c) {
   std::string res;
   if (c < 0x80) {
      res.push_back(static_cast<char>(c));
   } else if (c < 0x800) {
      res.push_back(static_cast<char>(0xC0 | (c >> 6)));
      res.push_back(static_cast<char>(0x80 | (c & 0x3F)));
   } else if (c < 0x10000) {
      res.push_back(static_cast<char>(0xE0 | (c >> 12)));
      res.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
      res.push_back(static_cast<char>(0x80 | (c & 0x3F)));
   } else if (c < 0x110000) {
      res.push_back(static_cast<char>(0xF0 | (c >> 18)));
      res.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
      res.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
      res.push_back(static_cast<char>(0x80 | (c & 0x3F)));
   }
   return res;
}

std::string to_utf8(std::u32string_view s) {
   std::string res;
   for (auto c : s)
      res += to_utf8(c);
   return res;
}

// invalid sequences decode as U+FFFD
std::u32string from_utf8(std::string_view s) {
   std::u32string res;
   size_t         i = 0;
   while (i < s.size()) {
      auto     c   = static_cast<unsigned char>(s[i]);
      size_t   len = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 0;
      char32_t cp  = 0;
      if (len == 0 || i + len > s.size()) {
         res.push_back(U'\uFFFD');
         ++i;
         continue;
      }
      cp = len == 1 ? c : len == 2 ? (c & 0x1F) : len == 3 ? (c & 0x0F) : (c & 0x07);
      bool ok = true;
      for (size_t j = 1; j < len; ++j) {
         auto cc = static_cast<unsigned char>(s[i + j]);
         if ((cc & 0xC0) != 0x80) {
            ok = false;
            break;
         }
         cp = (cp << 6) | (cc & 0x3F);
      }
      if (!ok) {
         res.push_back(U'\uFFFD');
         ++i;
         continue;
      }
      res.push_back(cp);
      i += len;
   }
   return res;
}

// ---------------------------------------------------------------------------------------------
//                              preedit callbacks
// ---------------------------------------------------------------------------------------------
static int preedit_start(XIC, XPointer client_data, XPointer) {
   auto* data = reinterpret_cast<InputContext::CallbackData*>(client_data);
   data->proc->guard([&] { data->proc->on_preedit_start(data->handle); });
   return -1; // no length limit
}

static void preedit_draw(XIC, XPointer client_data, XPointer call_data) {
   auto* data = reinterpret_cast<InputContext::CallbackData*>(client_data);
   auto* cs   = reinterpret_cast<XIMPreeditDrawCallbackStruct*>(call_data);
   data->proc->guard([&] { data->proc->on_preedit_draw(data->handle, *cs); });
}

static void preedit_done(XIC, XPointer client_data, XPointer) {
   auto* data = reinterpret_cast<InputContext::CallbackData*>(client_data);
   data->proc->guard([&] { data->proc->on_preedit_done(data->handle); });
}

static void preedit_caret(XIC, XPointer, XPointer call_data) {
   // we do not move the caret ourselves, report it unchanged
   auto* cs = reinterpret_cast<XIMPreeditCaretCallbackStruct*>(call_data);
   if (cs)
      cs->direction = XIMDontChange;
}

// ---------------------------------------------------------------------------------------------
InputContext::~InputContext() {
   if (_ic && !_xim_alive.expired())
      XDestroyIC(_ic);
}

void InputContext::set_focus(bool focused) {
   if (focused)
      XSetICFocus(_ic);
   else
      XUnsetICFocus(_ic);
}

void InputContext::set_spot(PhysicalPosition<int> pos) {
   XPoint        spot{static_cast<short>(pos.x), static_cast<short>(pos.y)};
   XVaNestedList attr = XVaCreateNestedList(0, XNSpotLocation, &spot, nullptr);
   XSetICValues(_ic, XNPreeditAttributes, attr, nullptr);
   XFree(attr);
}

void InputContext::reset() {
   if (char* s = XmbResetIC(_ic))
      XFree(s);
}

// ---------------------------------------------------------------------------------------------
void XimService::init(::Display* dpy) {
   if (_xim)
      return;
   _dpy = dpy;

   if (!setlocale(LC_CTYPE, ""))
      log_warning("could not set LC_CTYPE from the environment");
   XSetLocaleModifiers("");
   _xim = XOpenIM(dpy, nullptr, nullptr, nullptr);

   if (!_xim) {
      XSetLocaleModifiers("@im=none");
      _xim = XOpenIM(dpy, nullptr, nullptr, nullptr);
   }
   if (!_xim) {
      log_warning("no X input method available, text input is limited to XLookupString");
      return;
   }

   XIMStyles* styles = nullptr;
   if (!XGetIMValues(_xim, XNQueryInputStyle, &styles, nullptr) && styles) {
      for (unsigned short i = 0; i < styles->count_styles; ++i) {
         if (styles->supported_styles[i] == (XIMPreeditCallbacks | XIMStatusNothing))
            _callbacks_supported = true;
      }
      XFree(styles);
   }
   _alive = std::make_shared<char>(0);
   log_debug("XIM opened, preedit callbacks {}", _callbacks_supported ? "supported" : "not supported");
}

void XimService::shutdown() {
   if (!_xim)
      return;
   _alive.reset();
   XCloseIM(_xim);
   _xim                 = nullptr;
   _callbacks_supported = false;
}

std::shared_ptr<InputContext> XimService::create_context(::Window w, WindowHandle h, Procedure& proc) {
   if (!_xim)
      return {};

   auto data = std::make_unique<InputContext::CallbackData>(InputContext::CallbackData{&proc, h});
   XIC  ic   = nullptr;

   if (_callbacks_supported) {
      XIMCallback start{reinterpret_cast<XPointer>(data.get()), reinterpret_cast<XIMProc>(preedit_start)};
      XIMCallback draw{reinterpret_cast<XPointer>(data.get()), reinterpret_cast<XIMProc>(preedit_draw)};
      XIMCallback done{reinterpret_cast<XPointer>(data.get()), reinterpret_cast<XIMProc>(preedit_done)};
      XIMCallback caret{reinterpret_cast<XPointer>(data.get()), reinterpret_cast<XIMProc>(preedit_caret)};

      XVaNestedList attr = XVaCreateNestedList(0, XNPreeditStartCallback, &start, XNPreeditDrawCallback, &draw,
                                               XNPreeditDoneCallback, &done, XNPreeditCaretCallback, &caret, nullptr);
      ic = XCreateIC(_xim, XNInputStyle, XIMPreeditCallbacks | XIMStatusNothing, XNClientWindow, w, XNFocusWindow, w,
                     XNPreeditAttributes, attr, nullptr);
      XFree(attr);
   }
   if (!ic)
      ic = XCreateIC(_xim, XNInputStyle, XIMPreeditNothing | XIMStatusNothing, XNClientWindow, w, XNFocusWindow, w,
                     nullptr);
   if (!ic) {
      log_warning("XCreateIC failed for window {}", h);
      return {};
   }
   return std::make_shared<InputContext>(ic, std::move(data), std::weak_ptr<void>(_alive));
}

} // namespace wisp::ime
