#pragma once

// ── Identity ────────────────────────────────────────────────
constexpr const char* FLX_VERSION = "1.0.0";

// ── Configuration file ──────────────────────────────────────
constexpr const char* CONFIG_FILENAME     = ".flxrc.json";
constexpr const char* DEFAULT_AUTHOR      = "Developer";
constexpr const char* STATE_MANAGER_GETX  = "getx";
constexpr const char* STATE_MANAGER_BLOC  = "bloc";

// JSON keys as written by `flx config`. The aliases are accepted on read.
constexpr const char* KEY_USE_FREEZED          = "useFreezed";
constexpr const char* KEY_USE_EQUATABLE        = "useEquatable";
constexpr const char* KEY_STATE_MANAGER        = "defaultStateManager";
constexpr const char* KEY_AUTHOR               = "author";
constexpr const char* KEY_USE_FREEZED_ALIAS    = "useImmutableModels";
constexpr const char* KEY_USE_EQUATABLE_ALIAS  = "useValueEquality";

// ── Output layout ───────────────────────────────────────────
// Every generated path starts with one of these roots. Changing them breaks
// projects that already depend on the generated layout.
constexpr const char* FEATURES_ROOT = "lib/features";
constexpr const char* SHARED_ROOT   = "lib/shared";

// ── Debug log ───────────────────────────────────────────────
constexpr const char* LOG_FILENAME = "flx_debug.log";
