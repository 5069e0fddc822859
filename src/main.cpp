#include "../include/lcg_config.hpp"
#include "../include/lcg_utils.hpp"
#include "../include/lcg.hpp"
#include "../include/lcg_crack.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

static void usage(const char *prog) {
  fprintf(stderr, "Usage:\n");
  fprintf(stderr, "  %s V0 V1 V2 V3 [V4 ...]   (consecutive raw LCG states)\n", prog);
  fprintf(stderr, "  %s FILE                   (one value per line)\n", prog);
  fprintf(stderr, "\nOptions:\n");
  fprintf(stderr, "  -m M   modulus known out-of-band (needs %d values instead of %d)\n",
          LCG_MIN_SAMPLES_KNOWN_MODULUS, LCG_MIN_SAMPLES);
  fprintf(stderr, "  -n K   print K predicted values after the last observation (default %d)\n",
          LCG_CLI_DEFAULT_PREDICT);
  fprintf(stderr, "  -p K   print K values preceding the first observation (default 0)\n");
}

static int run(int argc, char **argv) {
  if (argc < 2) {
    usage(argv[0]);
    return 1;
  }

  std::vector<std::string> positional;
  std::string modulus_arg;
  u64 n_next = LCG_CLI_DEFAULT_PREDICT, n_prev = 0;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-m" || arg == "-n" || arg == "-p") {
      if (i + 1 >= argc) {
        fprintf(stderr, "Error: %s needs a value.\n", arg.c_str());
        return 1;
      }
      const char *val = argv[++i];
      if (arg == "-m") {
        if (!is_big_decimal(val)) {
          fprintf(stderr, "Error: invalid modulus for -m (got '%s').\n", val);
          return 1;
        }
        modulus_arg = val;
      } else if (!parse_count(val, arg == "-n" ? n_next : n_prev)) {
        fprintf(stderr, "Error: invalid count for %s (got '%s').\n", arg.c_str(), val);
        return 1;
      }
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.empty()) {
    fprintf(stderr, "Error: no observed values given.\n");
    return 1;
  }

  // Read values (file path or literals)
  auto t_input_start = now_tp();
  std::vector<cpp_int> values;
  size_t bad_line = 0;
  if (positional.size() == 1 && read_values_file(positional[0], values, &bad_line)) {
    printf("[input] read %zu values from %s\n", values.size(), positional[0].c_str());
  } else if (bad_line) {
    fprintf(stderr, "Error: %s:%zu is not a decimal integer.\n", positional[0].c_str(), bad_line);
    return 1;
  } else {
    values.clear();
    for (const std::string &s : positional) {
      if (!is_big_decimal(s)) {
        fprintf(stderr, "Error: '%s' is neither a readable file nor a decimal integer.\n", s.c_str());
        return 1;
      }
      values.push_back(read_big_decimal(s));
    }
    printf("[input] %zu values from the command line\n", values.size());
  }
  double input_ms = ms_since(t_input_start);

  for (size_t i = 0; i < values.size() && i < (size_t)LCG_MAX_REPORTED_VALUES; ++i)
    printf("  s[%zu] = %s\n", i, values[i].str().c_str());
  if (values.size() > (size_t)LCG_MAX_REPORTED_VALUES)
    printf("  ... (%zu more)\n", values.size() - LCG_MAX_REPORTED_VALUES);

  auto t_crack_start = now_tp();
  CrackFailure why = CrackFailure::none;
  std::optional<LCG> cracked;
  if (modulus_arg.empty()) {
    cpp_int candidate = recover_modulus(values);
    printf("[crack] modulus candidate: %s (%zu bits)\n",
           candidate.str().c_str(), bitlen_cppint(candidate));
    cracked = crack_lcg(values, &why);
  } else {
    cracked = crack_lcg_known_modulus(values, read_big_decimal(modulus_arg), &why);
  }
  double crack_ms = ms_since(t_crack_start);

  if (!cracked) {
    fprintf(stderr, "[crack] failed: %s\n", crack_failure_str(why));
    if (modulus_arg.empty() &&
        (why == CrackFailure::non_invertible || why == CrackFailure::inconsistent_sequence ||
         why == CrackFailure::degenerate_modulus))
      fprintf(stderr, "[crack] a longer run of consecutive values may pin the modulus down\n");
    return 1;
  }

  printf("\n=== Recovered parameters ===\n");
  printf("a = %s\n", cracked->a.str().c_str());
  printf("c = %s\n", cracked->c.str().c_str());
  printf("m = %s (%zu bits)\n", cracked->m.str().c_str(), bitlen_cppint(cracked->m));
  printf("invertible multiplier: %s\n", cracked->invertible() ? "yes" : "no");

  auto t_step_start = now_tp();
  if (n_next > 0) {
    printf("\n=== Next %llu values ===\n", (unsigned long long)n_next);
    LCG fwd = *cracked;
    fwd.discard(1);  // state currently holds the last observation
    for (u64 k = 1; k <= n_next; ++k)
      printf("[predict] +%llu %s\n", (unsigned long long)k, fwd.next().str().c_str());
  }

  if (n_prev > 0) {
    printf("\n=== Previous %llu values ===\n", (unsigned long long)n_prev);
    LCG back(values.front(), cracked->a, cracked->c, cracked->m);
    for (u64 k = 1; k <= n_prev; ++k) {
      std::optional<cpp_int> v = back.prev();
      if (!v) {
        fprintf(stderr, "[predict] multiplier not invertible modulo m, cannot step backward\n");
        break;
      }
      printf("[predict] -%llu %s\n", (unsigned long long)k, v->str().c_str());
    }
  }
  double step_ms = ms_since(t_step_start);

  printf("\n[profile] input=%.3fms crack=%.3fms stepping=%.3fms\n", input_ms, crack_ms, step_ms);
  return 0;
}

int main(int argc, char **argv) {
  try {
    return run(argc, argv);
  } catch (const std::exception &e) {
    fprintf(stderr, "Error: %s\n", e.what());
    return 1;
  }
}
