#pragma once

// ===== Project-wide switches (override with -D on the compiler line) =====
using u64  = unsigned long long;

// Minimum consecutive observations for a blind crack (modulus unknown).
// Two independent modulus candidates need four samples.
#ifndef LCG_MIN_SAMPLES
#define LCG_MIN_SAMPLES 4
#endif

// Minimum observations when the modulus is supplied by the caller
#ifndef LCG_MIN_SAMPLES_KNOWN_MODULUS
#define LCG_MIN_SAMPLES_KNOWN_MODULUS 3
#endif

// lcg_crack: predicted values printed when -n is not given
#ifndef LCG_CLI_DEFAULT_PREDICT
#define LCG_CLI_DEFAULT_PREDICT 5
#endif

// lcg_crack: observations echoed back before eliding the rest
#ifndef LCG_MAX_REPORTED_VALUES
#define LCG_MAX_REPORTED_VALUES 8
#endif
