#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "tg/orchestrator/config.h"
#include "tg/orchestrator/gate_validator.h"
#include "tg/security/input_sanitizer.h"
#include "tg/status.h"
#include "tg/storage/ledger.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitIntegrity = 2;

void PrintUsage(std::ostream& out) {
  out << "Usage: tg-audit verify-ledger <ledger> <base_dir>\n"
         "       tg-audit mask < input\n"
         "       tg-audit check-score <coverage|security_score|confidence|critical_vulns> <value>\n";
}

int Fail(const tg::Status& status) {
  std::cerr << "tg-audit: " << status << std::endl;
  return kExitFailure;
}

int VerifyLedger(const tg::orchestrator::TrustConfig& config, const std::filesystem::path& ledger_path,
                 const std::filesystem::path& base_dir) {
  tg::storage::LedgerOptions options;
  options.ledger_path = ledger_path;
  options.base_dir = base_dir;
  options.read_timeout = config.ledger_read_timeout;
  options.json_limits = config.json_limits;
  tg::storage::Ledger ledger(options);

  auto report = ledger.VerifyIntegrity();
  if (!report) {
    return Fail(report.status());
  }
  if (report->pass) {
    std::cout << "PASS: " << report->total_lines << " entries" << std::endl;
    return kExitOk;
  }
  std::cout << "FAIL: " << report->invalid_lines << " of " << report->total_lines << " lines malformed" << std::endl;
  std::cout << "  lines:";
  for (size_t line : report->invalid_line_numbers) {
    std::cout << ' ' << line;
  }
  std::cout << std::endl;
  return kExitIntegrity;
}

int Mask() {
  std::ostringstream buffer;
  buffer << std::cin.rdbuf();
  std::cout << tg::security::MaskSecrets(buffer.str());
  std::cout.flush();
  return std::cout ? kExitOk : kExitFailure;
}

int CheckScore(const std::string& kind_name, const std::string& value) {
  const auto kind = tg::orchestrator::ParseGateScoreKind(kind_name);
  if (!kind) {
    std::cerr << "tg-audit: unknown score kind '" << kind_name << "'" << std::endl;
    return kExitFailure;
  }
  auto result = tg::orchestrator::ValidateGateScore(*kind, value);
  if (!result) {
    return Fail(result.status());
  }
  std::cout << "OK " << *result << std::endl;
  return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage(std::cout);
      return kExitOk;
    }
    positional.push_back(arg);
  }
  if (positional.empty()) {
    PrintUsage(std::cerr);
    return kExitFailure;
  }

  try {
    const auto config = tg::orchestrator::LoadConfigFromEnvironment();
    tg::orchestrator::ConfigureEventLog(config);

    const auto& command = positional.front();
    if (command == "verify-ledger" && positional.size() == 3) {
      return VerifyLedger(config, positional[1], positional[2]);
    }
    if (command == "mask" && positional.size() == 1) {
      return Mask();
    }
    if (command == "check-score" && positional.size() == 3) {
      return CheckScore(positional[1], positional[2]);
    }
  } catch (const tg::Error& err) {
    return Fail(tg::Status::FromError(err));
  } catch (const std::exception& ex) {
    std::cerr << "tg-audit: " << tg::security::MaskSecrets(ex.what()) << std::endl;
    return kExitFailure;
  }
  PrintUsage(std::cerr);
  return kExitFailure;
}
