#pragma once

namespace scenecast::actor {

// Draws a fake pointer and click ripples. Idempotent; installs
// window.__sc_moveCursor(x, y) and window.__sc_clickEffect(x, y).
inline constexpr const char *CURSOR_OVERLAY_SCRIPT = R"JS((() => {
  if (document.getElementById('__sc_cursor')) return;
  const style = document.createElement('style');
  style.textContent = `
    #__sc_cursor { position: fixed; left: 0; top: 0; width: 20px; height: 20px;
      pointer-events: none; z-index: 2147483647; transform: translate(-2px, -2px); }
    #__sc_ripples { position: fixed; inset: 0; pointer-events: none; z-index: 2147483646; }
    .__sc_ripple { position: fixed; width: 28px; height: 28px; margin: -14px 0 0 -14px;
      border-radius: 50%; border: 2px solid rgba(59, 130, 246, 0.9);
      animation: __sc_ripple 420ms ease-out forwards; }
    @keyframes __sc_ripple { from { transform: scale(0.3); opacity: 1; }
      to { transform: scale(1.6); opacity: 0; } }`;
  document.head.appendChild(style);
  const cursor = document.createElement('div');
  cursor.id = '__sc_cursor';
  cursor.innerHTML = '<svg width="20" height="20" viewBox="0 0 20 20">' +
    '<path d="M2 1 L2 16 L6 12 L9 19 L11.5 18 L8.5 11 L14 11 Z" ' +
    'fill="#111" stroke="#fff" stroke-width="1.2"/></svg>';
  document.body.appendChild(cursor);
  const ripples = document.createElement('div');
  ripples.id = '__sc_ripples';
  document.body.appendChild(ripples);
  window.__sc_moveCursor = (x, y) => {
    cursor.style.left = x + 'px';
    cursor.style.top = y + 'px';
  };
  window.__sc_clickEffect = (x, y) => {
    const ring = document.createElement('div');
    ring.className = '__sc_ripple';
    ring.style.left = x + 'px';
    ring.style.top = y + 'px';
    ripples.appendChild(ring);
    setTimeout(() => ring.remove(), 500);
  };
})())JS";

inline constexpr const char *HIDE_CURSOR_INIT_SCRIPT = R"JS(document.addEventListener('DOMContentLoaded', () => {
  const style = document.createElement('style');
  style.textContent = '* { cursor: none !important; }';
  document.head.appendChild(style);
});)JS";

inline constexpr const char *FAST_MODE_INIT_SCRIPT = R"JS(document.addEventListener('DOMContentLoaded', () => {
  const style = document.createElement('style');
  style.textContent = '*, *::before, *::after { animation-duration: 1ms !important; ' +
    'animation-delay: 0s !important; transition-duration: 1ms !important; ' +
    'transition-delay: 0s !important; scroll-behavior: auto !important; }';
  document.head.appendChild(style);
});)JS";

} // namespace scenecast::actor
