#include "engine/capsule/capsule.hpp"

#include "engine/capsule/invariants.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/logging.hpp"
#include "engine/observe/trace_generators.hpp"
#include "engine/pipeline/engine_run.hpp"
#include "engine/seal/manifest.hpp"

#include <exception>
#include <filesystem>
#include <system_error>

namespace sssl::capsule {

namespace fs = std::filesystem;

namespace {

struct CapsulePaths final {
    fs::path root;
    fs::path data;
    fs::path capsule;
    fs::path out;
    fs::path work;
};

CapsulePaths resolve_paths(const fs::path& repo_root) {
    std::error_code ec;
    fs::path root = fs::absolute(repo_root, ec);
    SSSL_ENSURE(!ec, ErrorCode::kIoError, "cannot resolve repo_root: " + repo_root.generic_string());
    root = root.lexically_normal();

    CapsulePaths p;
    p.root = root;
    p.data = root / "data";
    p.capsule = root / kCapsuleDirName;
    p.out = p.capsule / kOutDirName;
    p.work = p.capsule / kWorkDirName;
    return p;
}

// Drives one case through its stages. `report.stage` always names the stage
// currently executing, so a throw leaves it pointing at the failing step.
void run_case(const CaseSpec& spec, const CapsulePaths& paths, const ExecEnv& env, CaseReport& report) {
    fs::path in_csv;
    pipeline::EngineConfig cfg;

    report.name = spec.name;
    report.out_a = paths.out / (std::string(spec.name) + "_REPLAY_A");
    report.out_b = paths.out / (std::string(spec.name) + "_REPLAY_B");

    for (report.stage = CaseStage::kResolveInput; report.stage != CaseStage::kPassed;
         report.stage = next_stage(report.stage)) {
        log_debug(std::string("capsule: ") + spec.name + " " + to_string(report.stage));

        switch (report.stage) {
            case CaseStage::kResolveInput:
                if (*spec.data_file != '\0') {
                    in_csv = paths.data / spec.data_file;
                    require_file(in_csv);
                } else {
                    in_csv = paths.work / kNegctlInputName;
                    observe::write_trace_csv(in_csv, observe::negative_control_trace(),
                                             observe::TraceStyle::kPlainLf);
                }
                cfg.in_csv = in_csv;
                cfg.substrate = true;
                ensure_clean_dir(report.out_a);
                ensure_clean_dir(report.out_b);
                break;

            case CaseStage::kRunA:
            case CaseStage::kRunB: {
                cfg.out_dir = (report.stage == CaseStage::kRunA) ? report.out_a : report.out_b;
                const pipeline::EngineResult res = pipeline::run_engine(cfg, env);
                SSSL_ENSURE(res.has_verdict, ErrorCode::kInternal,
                            "engine run produced no admissibility verdict: " + res.out_dir.generic_string());
                log_debug(std::string("capsule: ") + spec.name + " " + to_string(report.stage) +
                          " adm_E=" + substrate::to_string(res.adm.verdict));
                break;
            }

            case CaseStage::kSeal:
                seal::seal_directory(report.out_a, seal::ManifestStyle::kText);
                seal::seal_directory(report.out_b, seal::ManifestStyle::kText);
                break;

            case CaseStage::kVerifyA:
                require_invariants(report.out_a, spec.expected);
                break;

            case CaseStage::kVerifyB:
                require_invariants(report.out_b, spec.expected);
                break;

            case CaseStage::kCompare:
                require_replay_match(spec.name, report.out_a, report.out_b);
                break;

            case CaseStage::kPassed:
                break;
        }
    }
    log_info(std::string("capsule: ") + spec.name + " passed");
}

void fail(CapsuleOutcome& out, ErrorCode code, const std::string& message, const CaseReport* report) {
    const CaseStage stage = report ? report->stage : CaseStage::kResolveInput;
    out.passed = false;
    out.error = code;
    out.failed_stage = stage;
    out.failed_case = report ? report->name : std::string{};
    out.message = message;
    out.exit_code = exit_code_for(code, stage);
    // The CLI prints the one diagnostic line; this stays below its default threshold.
    log_info("capsule: " + (report ? report->name + " @ " + to_string(stage) + ": " : std::string{}) + message);
}

} // namespace

const char* to_string(CaseStage s) noexcept {
    switch (s) {
        case CaseStage::kResolveInput: return "ResolveInput";
        case CaseStage::kRunA:         return "RunA";
        case CaseStage::kRunB:         return "RunB";
        case CaseStage::kSeal:         return "Seal";
        case CaseStage::kVerifyA:      return "VerifyA";
        case CaseStage::kVerifyB:      return "VerifyB";
        case CaseStage::kCompare:      return "Compare";
        case CaseStage::kPassed:       return "Passed";
    }
    return "?";
}

CaseStage next_stage(CaseStage s) noexcept {
    switch (s) {
        case CaseStage::kResolveInput: return CaseStage::kRunA;
        case CaseStage::kRunA:         return CaseStage::kRunB;
        case CaseStage::kRunB:         return CaseStage::kSeal;
        case CaseStage::kSeal:         return CaseStage::kVerifyA;
        case CaseStage::kVerifyA:      return CaseStage::kVerifyB;
        case CaseStage::kVerifyB:      return CaseStage::kCompare;
        case CaseStage::kCompare:      return CaseStage::kPassed;
        case CaseStage::kPassed:       return CaseStage::kPassed;
    }
    return CaseStage::kPassed;
}

const std::array<CaseSpec, 4>& core_cases() {
    static const std::array<CaseSpec, 4> cases = {{
        {"SMOKE", "sssl_smoke.csv", substrate::Verdict::Allow},
        {"MECH", "sssl_mech_vibration.csv", substrate::Verdict::Allow},
        {"FLUID", "sssl_fluid_pressure.csv", substrate::Verdict::Allow},
        {"NEGCTL_ABSTAIN", "", substrate::Verdict::Abstain},
    }};
    return cases;
}

ExitCode exit_code_for(ErrorCode code, CaseStage stage) noexcept {
    if (code == ErrorCode::kMissingArtifact) return ExitCode::kMissing;
    if (stage == CaseStage::kRunA || stage == CaseStage::kRunB) return ExitCode::kFail;
    switch (code) {
        case ErrorCode::kInvariant:
        case ErrorCode::kReplayMismatch:
            return ExitCode::kInvariant;
        case ErrorCode::kData:
            return (stage == CaseStage::kVerifyA || stage == CaseStage::kVerifyB) ? ExitCode::kInvariant
                                                                                 : ExitCode::kFail;
        default:
            return ExitCode::kFail;
    }
}

const char* diagnostic_prefix(ErrorCode code, ExitCode exit_code) noexcept {
    switch (exit_code) {
        case ExitCode::kMissing:
            return "MISSING";
        case ExitCode::kInvariant:
            return code == ErrorCode::kReplayMismatch ? "REPLAY_MISMATCH" : "INVARIANT";
        default:
            return "FAIL";
    }
}

std::string render_capsule_summary() {
    std::string s;
    s += "SSSL_VERIFY_CAPSULE\n";
    s += "CASES:";
    const char* sep = " ";
    for (const auto& c : core_cases()) {
        s += sep;
        s += c.name;
        sep = ", ";
    }
    s += "\n";
    s += "INVARIANTS:\n";
    s += "phi((m,a,s)) = m\n";
    s += "A4 = {Z0, Eplus, S, Eminus}\n";
    s += "|A4| = 4\n";
    s += "rho(P) = 1\n";
    s += "B_A = B_B\n";
    s += "RESULT: PASS\n";
    return s;
}

void require_replay_match(const std::string& case_name, const fs::path& out_a, const fs::path& out_b) {
    const seal::DirComparison cmp = seal::compare_directories(out_a, out_b);
    SSSL_ENSURE(cmp.equal, ErrorCode::kReplayMismatch,
                "replay mismatch: B_A != B_B for " + case_name + " (" + cmp.first_difference + ")");
}

CapsuleOutcome run_capsule(const CapsuleConfig& cfg) {
    CapsuleOutcome out;
    CaseReport* current = nullptr;

    try {
        SSSL_ENSURE(cfg.cases == "core", ErrorCode::kInvalidArgument, "unknown case set: " + cfg.cases);
        cfg.env.validate_or_throw();

        const CapsulePaths paths = resolve_paths(cfg.repo_root);
        log_info("capsule: repo_root=" + paths.root.generic_string() + " (" + cfg.env.describe() + ")");

        for (const auto& c : core_cases()) {
            if (*c.data_file != '\0') require_file(paths.data / c.data_file);
        }

        ensure_clean_dir(paths.out);
        ensure_clean_dir(paths.work);

        out.cases.reserve(core_cases().size());
        for (const auto& c : core_cases()) {
            out.cases.emplace_back();
            current = &out.cases.back();
            run_case(c, paths, cfg.env, *current);
        }
        current = nullptr;

        out.summary_path = paths.capsule / kSummaryName;
        write_file(out.summary_path, render_capsule_summary());

        out.passed = true;
        out.exit_code = ExitCode::kPass;
        log_info("capsule: PASS");
    } catch (const Error& e) {
        fail(out, e.code(), e.message(), current);
    } catch (const std::exception& e) {
        fail(out, ErrorCode::kInternal, e.what(), current);
    }
    return out;
}

} // namespace sssl::capsule
