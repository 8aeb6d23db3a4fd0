#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "challenge.hpp"
#include "challenge_codec.hpp"
#include "pow_verifier.hpp"
#include "solver_coordinator.hpp"

using namespace powgate;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_BAD_INPUT = 1;
constexpr int EXIT_TIMEOUT = 2;
constexpr int EXIT_ALL_LANES_FAILED = 3;

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [challenge source] [options]\n"
              << "Challenge source (one of):\n"
              << "  --challenge <c> --difficulty <d> --issued-at <ts> [--signature <hex>]\n"
              << "  --json <file|->      JSON object as served by /pow/challenge\n"
              << "  --token <token>      compact base64url challenge token\n"
              << "Options:\n"
              << "  --lanes <n>          search lanes (default: hardware concurrency)\n"
              << "  --timeout <ms>       wall-clock budget (default 60000)\n"
              << "  --portable           force the portable SHA-256 path\n"
              << "  --verify-secret <s>  verify the solution locally with this secret\n"
              << "  --help, -h           Show this help\n";
}

std::string read_all(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}

int main(int argc, char* argv[]) {
    std::string challenge_arg, difficulty_arg, issued_at_arg, signature_arg;
    std::string json_path, token, verify_secret;
    size_t lanes = 0;
    long long timeout_ms = 60000;
    bool portable = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + arg);
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return EXIT_OK;
            } else if (arg == "--challenge") {
                challenge_arg = next();
            } else if (arg == "--difficulty") {
                difficulty_arg = next();
            } else if (arg == "--issued-at") {
                issued_at_arg = next();
            } else if (arg == "--signature") {
                signature_arg = next();
            } else if (arg == "--json") {
                json_path = next();
            } else if (arg == "--token") {
                token = next();
            } else if (arg == "--lanes") {
                lanes = static_cast<size_t>(std::stoul(next()));
            } else if (arg == "--timeout") {
                timeout_ms = std::stoll(next());
            } else if (arg == "--portable") {
                portable = true;
            } else if (arg == "--verify-secret") {
                verify_secret = next();
            } else {
                throw std::invalid_argument("Unknown argument: " + arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[!] " << e.what() << "\n";
        print_usage(argv[0]);
        return EXIT_BAD_INPUT;
    }

    std::optional<Challenge> challenge;
    try {
        if (!token.empty()) {
            challenge = ChallengeCodec::decode_token(token);
        } else if (!json_path.empty()) {
            challenge = ChallengeCodec::challenge_from_json(read_all(json_path));
        } else {
            boost::json::object obj;
            obj["challenge"] = challenge_arg;
            obj["difficulty"] = difficulty_arg;
            obj["issued_at"] = issued_at_arg;
            if (!signature_arg.empty()) obj["signature"] = signature_arg;
            challenge = ChallengeCodec::challenge_from_json(boost::json::serialize(obj));
        }
    } catch (const std::exception& e) {
        std::cerr << "[!] " << e.what() << "\n";
        return EXIT_BAD_INPUT;
    }

    if (!challenge) {
        std::cerr << "[!] Missing or malformed challenge\n";
        return EXIT_BAD_INPUT;
    }
    if (timeout_ms <= 0) {
        std::cerr << "[!] Timeout must be positive\n";
        return EXIT_BAD_INPUT;
    }

    SolverOptions options;
    options.lanes = lanes;
    options.strategy = portable ? StrategyPreference::PORTABLE : StrategyPreference::AUTO;

    try {
        SolverCoordinator solver(options);

        std::cerr << "[*] Challenge: " << challenge->challenge_string << "\n"
                  << "[*] Difficulty: " << challenge->difficulty << " (leading hex zeros)\n"
                  << "[*] Lanes: " << solver.lane_count() << " (" << solver.strategy_name() << ")\n";

        auto on_progress = [](const ProgressSnapshot& p) {
            std::cerr << "\r[*] " << p.total_attempts << " hashes, "
                      << std::fixed << std::setprecision(0) << p.hash_rate << " H/s, "
                      << p.elapsed.count() << "ms" << std::flush;
        };

        Solution solution = solver.solve(*challenge, std::chrono::milliseconds(timeout_ms), on_progress);
        SolveStats stats = solver.last_stats();

        std::cerr << "\n[+] Nonce " << solution.nonce << " from lane " << solution.lane
                  << " after " << stats.total_attempts << " hashes in " << stats.elapsed.count() << "ms\n"
                  << "[+] Digest " << solution.digest_hex() << "\n";

        for (const auto& line : ChallengeCodec::solution_header_lines(*challenge, solution.nonce)) {
            std::cout << line << "\n";
        }

        if (!verify_secret.empty()) {
            VerifierOptions verifier_options;
            verifier_options.secret = verify_secret;
            verifier_options.max_difficulty = MAX_NIBBLE_DIFFICULTY;
            PoWVerifier verifier(verifier_options);
            VerificationResult result = verifier.verify(*challenge, solution.nonce);
            std::cerr << "[*] Local verification: " << result.label() << "\n";
        }

        return EXIT_OK;
    } catch (const SolveError& e) {
        std::cerr << "\n[-] " << e.what() << "\n";
        return e.code() == SolveError::Code::TIMEOUT ? EXIT_TIMEOUT : EXIT_ALL_LANES_FAILED;
    } catch (const std::exception& e) {
        std::cerr << "[!] " << e.what() << "\n";
        return EXIT_BAD_INPUT;
    }
}
