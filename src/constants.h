#pragma once
#include <cstdint>
#include <cstddef>

// =============================================================================
// DLSAUDIT CONSTANTS
// Block store layout and tool defaults
// =============================================================================

// === KEY LAYOUT ===
// A 64-bit key is 16 hex digits: 10 slot digits, 3 bucket digits and
// 3 digits addressing the key inside its bucket.
#ifndef DLS_SLOT_DIGITS
#define DLS_SLOT_DIGITS 10
#endif
#ifndef DLS_BUCKET_DIGITS
#define DLS_BUCKET_DIGITS 3
#endif
#ifndef DLS_KEY_DIGITS
#define DLS_KEY_DIGITS 3
#endif

// === FILE NAMING ===
#ifndef DLS_ARCHIVE_SUFFIX
#define DLS_ARCHIVE_SUFFIX ".gz"
#endif
#ifndef DLS_BROKEN_SUFFIX
#define DLS_BROKEN_SUFFIX ".broken"
#endif
#ifndef DLS_REPAIRING_SUFFIX
#define DLS_REPAIRING_SUFFIX ".repairing"
#endif
#ifndef DLS_SIZEINFO_NAME
#define DLS_SIZEINFO_NAME "sizeinfo"
#endif

// === PROGRESS ===
#ifndef DLS_PROGRESS_INTERVAL_MS
#define DLS_PROGRESS_INTERVAL_MS 2000  // heartbeat line cadence during directory scans
#endif

namespace dls {

static constexpr size_t SLOT_DIGITS   = DLS_SLOT_DIGITS;
static constexpr size_t BUCKET_DIGITS = DLS_BUCKET_DIGITS;
static constexpr size_t KEY_DIGITS    = DLS_KEY_DIGITS;
static constexpr size_t TOTAL_DIGITS  = sizeof(uint64_t) * 2;

static_assert(SLOT_DIGITS + BUCKET_DIGITS + KEY_DIGITS == TOTAL_DIGITS,
              "key layout must cover exactly 64 bits");

static constexpr uint64_t KEYS_PER_BLOCK = 1ull << (KEY_DIGITS * 4);  // 4096
static constexpr uint64_t BLOCK_KEY_MASK = KEYS_PER_BLOCK - 1;        // 0xFFF

// On-disk record header: [u64 key][u64 length]
static constexpr size_t FIELD_SIZE         = sizeof(uint64_t);
static constexpr size_t RECORD_HEADER_SIZE = 2 * FIELD_SIZE;

// Sidecar: [u64 records][u64 size]
static constexpr size_t SIZEINFO_FILE_SIZE = 2 * FIELD_SIZE;

// Exit codes
static constexpr int EXIT_OK             = 0;
static constexpr int EXIT_SIZE_MISMATCH  = 1;
static constexpr int EXIT_USAGE          = 2;
static constexpr int EXIT_UNRESOLVABLE   = 3;
static constexpr int EXIT_UNOPENABLE     = 4;  // single block file missing or unreadable

}
