// ==============================================================================
// Taper Lint Stub - Compiles every public header in one translation unit
// ==============================================================================
// Gives static analysis a .cpp file that includes each header of the
// header-only library, so a header that is not self-contained fails to build.
//
// Not part of the library itself; it is built as a separate OBJECT library
// target (taper_lint_stub).
// ==============================================================================

// Layer 0: Core
#include <taper/core/bit_field.h>
#include <taper/core/crc16.h>
#include <taper/core/gain_units.h>
#include <taper/core/mpeg_tables.h>

// Layer 1: Frame Codec
#include <taper/codec/comment_tag.h>
#include <taper/codec/frame_header.h>
#include <taper/codec/frame_sync.h>
#include <taper/codec/mp3_frame.h>
#include <taper/codec/side_info.h>
#include <taper/codec/stream_io.h>
#include <taper/codec/stream_item.h>

// Layer 2: Fade Components
#include <taper/fade/fade_in_strategy.h>
#include <taper/fade/fade_strategy.h>
#include <taper/fade/fade_types.h>
#include <taper/fade/fade_window_buffer.h>
#include <taper/fade/gain_adjuster.h>
#include <taper/fade/ramp_planner.h>

// Layer 3: Fade Pipeline
#include <taper/fade/fade_pipeline.h>
