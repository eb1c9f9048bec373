// ============================================================================
// Fragment 6.3 — Verification Capsule (double-run replay + invariant gate)
// File: cpp/engine/capsule/capsule.hpp
// ============================================================================
//
// Purpose:
// - Run every core case twice with the engine (in-process, substrate on),
//   reseal both directories, check invariants on each, and demand that the
//   two directories are byte-identical.
// - Stop at the first failure; report a category-specific exit code.
//
// Layout under <repo_root>:
//   data/sssl_smoke.csv, data/sssl_mech_vibration.csv,
//   data/sssl_fluid_pressure.csv                      (inputs, required)
//   VERIFY_SSSL_CAPSULE/_WORK/negctl_abstain.csv      (generated input)
//   VERIFY_SSSL_CAPSULE/OUT/<CASE>_REPLAY_{A,B}/      (replay outputs)
//   VERIFY_SSSL_CAPSULE/CAPSULE_SUMMARY.txt           (written on PASS)
//
// Per-case stage machine:
//   ResolveInput -> RunA -> RunB -> Seal -> VerifyA -> VerifyB -> Compare -> Passed
//
// Exit codes:
//   0  PASS
//   1  engine run failure, or any error not listed below
//   2  argument error (CLI only)
//   3  MissingArtifact
//   4  InvariantViolation / ReplayMismatch / DataError while verifying
// ============================================================================

#pragma once

#include "engine/core/error.hpp"
#include "engine/core/settings.hpp"
#include "engine/substrate/admissibility.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sssl::capsule {

inline constexpr const char* kCapsuleDirName = "VERIFY_SSSL_CAPSULE";
inline constexpr const char* kOutDirName = "OUT";
inline constexpr const char* kWorkDirName = "_WORK";
inline constexpr const char* kSummaryName = "CAPSULE_SUMMARY.txt";
inline constexpr const char* kNegctlInputName = "negctl_abstain.csv";

enum class ExitCode : int {
    kPass = 0,
    kFail = 1,
    kArgs = 2,
    kMissing = 3,
    kInvariant = 4,
};

enum class CaseStage : std::uint8_t {
    kResolveInput = 0,
    kRunA,
    kRunB,
    kSeal,
    kVerifyA,
    kVerifyB,
    kCompare,
    kPassed,
};

const char* to_string(CaseStage s) noexcept;

// Successor in the stage chain; kPassed is terminal.
CaseStage next_stage(CaseStage s) noexcept;

struct CaseSpec final {
    const char* name = "";
    // Relative to <repo_root>/data; empty for the generated negative control.
    const char* data_file = "";
    substrate::Verdict expected = substrate::Verdict::Allow;
};

// SMOKE, MECH, FLUID, NEGCTL_ABSTAIN in that order.
const std::array<CaseSpec, 4>& core_cases();

struct CapsuleConfig final {
    std::filesystem::path repo_root = "..";
    std::string cases = "core";
    ExecEnv env;
};

struct CaseReport final {
    std::string name;
    CaseStage stage = CaseStage::kResolveInput;
    std::filesystem::path out_a;
    std::filesystem::path out_b;
};

struct CapsuleOutcome final {
    ExitCode exit_code = ExitCode::kPass;
    bool passed = false;

    // Set on failure.
    ErrorCode error = ErrorCode::kInternal;
    std::string failed_case;
    CaseStage failed_stage = CaseStage::kResolveInput;
    std::string message;

    std::vector<CaseReport> cases;
    std::filesystem::path summary_path;
};

// Category -> exit code, given the stage the error surfaced in.
ExitCode exit_code_for(ErrorCode code, CaseStage stage) noexcept;

// "MISSING", "INVARIANT", "REPLAY_MISMATCH" or "FAIL".
const char* diagnostic_prefix(ErrorCode code, ExitCode exit_code) noexcept;

// ReplayMismatch naming the first differing file unless both sealed
// directories hold the same files with the same digests.
void require_replay_match(const std::string& case_name, const std::filesystem::path& out_a,
                          const std::filesystem::path& out_b);

CapsuleOutcome run_capsule(const CapsuleConfig& cfg);

std::string render_capsule_summary();

} // namespace sssl::capsule
