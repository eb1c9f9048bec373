// ============================================================================
// Fragment 5.2 — Engine Run (ingest -> classify -> substrate -> seal)
// File: cpp/engine/pipeline/engine_run.hpp
// ============================================================================
//
// Purpose:
// - One deterministic pass from an observation CSV to a sealed artifact
//   directory. Used by the sssl_verify CLI and, in-process, by the capsule.
//
// Rules:
// - All parameter and input validation happens before the first write.
// - The ExecEnv is passed in by value semantics; its locale is imbued on
//   every artifact stream of this run and nothing process-global changes.
// - The engine manifest (asterisk style) is written last and lists exactly
//   the artifacts this run wrote.
// ============================================================================

#pragma once

#include "engine/core/settings.hpp"
#include "engine/substrate/admissibility.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace sssl::pipeline {

struct EngineConfig final {
    std::filesystem::path in_csv;
    std::filesystem::path out_dir = "outputs";
    ClassifyParams classify;
    bool substrate = false;
    AccumParams accum;
    AdmParams adm;

    void validate_or_throw() const;
};

struct EngineResult final {
    std::filesystem::path out_dir;
    std::filesystem::path manifest;
    std::vector<std::string> artifacts;  // sorted, manifest excluded
    std::size_t observations = 0;
    bool has_verdict = false;
    substrate::AdmResult adm;
};

EngineResult run_engine(const EngineConfig& cfg, const ExecEnv& env);

} // namespace sssl::pipeline
