#pragma once
/*
================================================================================
Fragment 1.4 — Core: Run Parameters + Pinned Execution Context (Hardened)
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every knob that shapes an artifact set into validated objects.
  - Identical parameters + identical input => byte-identical artifacts.

Groups:
  - ClassifyParams : posture rule thresholds (tau0, taus, eps, drop)
  - AccumParams    : accumulation fold (s0, s_max, inc_on_eminus, dec_on_s)
  - AdmParams      : admissibility thresholds
  - ExecEnv        : pinned execution context handed to each run explicitly

Hardening:
  - validate_or_throw() rejects nonsensical values before any I/O happens.
  - ExecEnv is a value, never process-global state, so two runs can never
    observe each other's context.
================================================================================
*/

#include <cmath>
#include <cstdint>
#include <string>

#include "engine/core/error.hpp"

namespace sssl {

// ----------------------------- Classification --------------------------------
struct ClassifyParams {
  double tau0 = 0.05;   // Z0 ceiling on E
  double taus = 0.70;   // S floor on E
  double eps  = 0.02;   // flatness band on |dE/dt|
  double drop = 0.15;   // Eminus trigger on dE/dt <= -|drop|

  void validate_or_throw() const {
    SSSL_ENSURE(std::isfinite(tau0), ErrorCode::kInvalidArgument, "ClassifyParams: tau0 not finite");
    SSSL_ENSURE(std::isfinite(taus), ErrorCode::kInvalidArgument, "ClassifyParams: taus not finite");
    SSSL_ENSURE(std::isfinite(eps), ErrorCode::kInvalidArgument, "ClassifyParams: eps not finite");
    SSSL_ENSURE(std::isfinite(drop), ErrorCode::kInvalidArgument, "ClassifyParams: drop not finite");
  }
};

// ----------------------------- Accumulation ----------------------------------
struct AccumParams {
  std::int64_t s0 = 0;
  std::int64_t s_max = 50;
  std::int64_t inc_on_eminus = 1;
  std::int64_t dec_on_s = 1;

  // These bounds are what keep every accumulator value inside [0, s_max].
  void validate_or_throw() const {
    SSSL_ENSURE(s_max >= 0, ErrorCode::kInvalidArgument, "AccumParams: s_max must be >= 0");
    SSSL_ENSURE(s0 >= 0 && s0 <= s_max, ErrorCode::kInvalidArgument, "AccumParams: s0 must lie in [0, s_max]");
    SSSL_ENSURE(inc_on_eminus >= 0, ErrorCode::kInvalidArgument, "AccumParams: inc_on_eminus must be >= 0");
    SSSL_ENSURE(dec_on_s >= 0, ErrorCode::kInvalidArgument, "AccumParams: dec_on_s must be >= 0");
  }
};

// ----------------------------- Admissibility ---------------------------------
struct AdmParams {
  double collapse_ratio_max = 0.60;
  double churn_ratio_max = 0.80;
  std::int64_t require_s = 0;

  void validate_or_throw() const {
    SSSL_ENSURE(std::isfinite(collapse_ratio_max), ErrorCode::kInvalidArgument,
                "AdmParams: collapse_ratio_max not finite");
    SSSL_ENSURE(std::isfinite(churn_ratio_max), ErrorCode::kInvalidArgument,
                "AdmParams: churn_ratio_max not finite");
    SSSL_ENSURE(require_s >= 0, ErrorCode::kInvalidArgument, "AdmParams: require_s must be >= 0");
  }
};

// ----------------------------- Execution context -----------------------------
// Hash seed, locale and timezone a run is pinned to. The locale is imbued on
// every artifact stream of that run; hash_seed and tz are carried for the run
// record (the engine draws no randomness and reads no clock).
struct ExecEnv {
  std::string hash_seed = "0";
  std::string locale = "C";
  std::string tz = "UTC";

  void validate_or_throw() const {
    SSSL_ENSURE(!hash_seed.empty(), ErrorCode::kInvalidArgument, "ExecEnv: hash_seed empty");
    SSSL_ENSURE(!locale.empty(), ErrorCode::kInvalidArgument, "ExecEnv: locale empty");
    SSSL_ENSURE(!tz.empty(), ErrorCode::kInvalidArgument, "ExecEnv: tz empty");
  }

  std::string describe() const {
    return "hash_seed=" + hash_seed + " locale=" + locale + " tz=" + tz;
  }
};

} // namespace sssl
