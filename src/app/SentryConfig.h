#pragma once

// Build-flag defaults. Values saved over the serial console (NVS) win.

#ifndef SESAME_API_KEY
#define SESAME_API_KEY ""
#endif

#ifndef SESAME_API_BASE_URL
#define SESAME_API_BASE_URL "https://app.candyhouse.co/api/sesame2"
#endif

#ifndef SESAME_DEVICE_IDS
#define SESAME_DEVICE_IDS ""
#endif

#ifndef SESAME_DEVICE_NAMES
#define SESAME_DEVICE_NAMES ""
#endif

#ifndef SESAME_SECRETS
#define SESAME_SECRETS ""
#endif

#ifndef SESAME_HISTORY_TAG
#define SESAME_HISTORY_TAG "LockSentry"
#endif

#ifndef TELEGRAM_BOT_TOKEN
#define TELEGRAM_BOT_TOKEN ""
#endif

#ifndef TELEGRAM_CHAT_ID
#define TELEGRAM_CHAT_ID ""
#endif

#ifndef TELEGRAM_API_BASE_URL
#define TELEGRAM_API_BASE_URL "https://api.telegram.org"
#endif

#ifndef TELEGRAM_POLL_MS
#define TELEGRAM_POLL_MS 1000
#endif

#ifndef CHAT_RETRY_MS
#define CHAT_RETRY_MS 10000
#endif

#ifndef CHECK_INTERVAL_SECONDS
#define CHECK_INTERVAL_SECONDS "60"
#endif

// PEM root certificate for the HTTPS endpoints. Empty means unverified TLS.
#ifndef HTTPS_ROOT_CA
#define HTTPS_ROOT_CA ""
#endif
