#include "tg/status.h"

#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>

#include "tg/crypto/random.h"
#include "tg/crypto/sha256.h"
#include "tg/errors.h"
#include "test_support.h"

namespace {

using tg::CaptureStatus;
using tg::Error;
using tg::ErrorDomain;
using tg::Result;
using tg::Status;

void TestStatusBasics() {
  const Status ok = Status::Ok();
  assert(ok.ok());
  assert(ok.tag() == "ok");
  assert(ok.ToString() == "[ok]");

  const auto escape = Status::Fail(ErrorDomain::Validation, tg::errors::validation::kPathEscape,
                                   tg::errors::msg::kPathEscapesBase);
  assert(!escape);
  assert(escape.domain() == ErrorDomain::Validation);
  assert(escape.tag() == "validation.path_escape");
  assert(escape.ToString() == "[validation.path_escape] Path escapes base directory");

  // a zero code never reads as success
  const auto zero = Status::Fail(ErrorDomain::IO, 0, "odd");
  assert(!zero.ok());
  assert(zero.tag() == "internal.unexpected");

  // messages are masked on construction
  const auto leaky = Status::Fail(ErrorDomain::IO, tg::errors::io::kOpenFailed,
                                  "open failed for postgres://svc:Sup3rSecret@db/app");
  assert(leaky.message().find("Sup3rSecret") == std::string::npos);
  assert(leaky.message().find("[REDACTED]") != std::string::npos);

  assert(tg::ReasonTag(tg::errors::lock::kTimeout) == "lock.timeout");
  assert(tg::ReasonTag(tg::errors::security::kSymlinkSwapDetected) == "security.symlink_swap");
  assert(tg::ReasonTag(tg::errors::config::kThresholdClamped) == "config.threshold_clamped");
  assert(tg::ReasonTag(123456789) == "internal.unclassified");
}

void TestCaptureStatus() {
  auto fine = CaptureStatus([] {});
  assert(fine.ok());

  auto thrown = CaptureStatus([] {
    throw Error{ErrorDomain::Lock, tg::errors::lock::kTimeout, "held elsewhere", std::nullopt,
                tg::Retryability::kTransient};
  });
  assert(thrown.IsLockTimeout());
  assert(thrown.retryability() == tg::Retryability::kTransient);

  auto native = CaptureStatus([] { throw Error{ErrorDomain::IO, 2, "errno leaked as code"}; });
  assert(native.tag() == "io.native_failure");

  auto unknown = CaptureStatus([] { throw std::runtime_error("token=abcdef123456 boom"); });
  assert(unknown.tag() == "internal.unexpected");
  assert(unknown.message().find("abcdef123456") == std::string::npos);

  auto value = CaptureStatus([] { return Result<int>(41 + 1); });
  assert(value && *value == 42);
  auto failed_value = CaptureStatus([]() -> Result<int> {
    throw Error{ErrorDomain::Validation, tg::errors::validation::kOutOfRange, "too big"};
  });
  assert(!failed_value);
  assert(failed_value.status().tag() == "validation.out_of_range");

  auto status_fn = CaptureStatus([] { return Status::Ok(); });
  assert(status_fn.ok());

  // move-only payloads pass through
  auto owned = CaptureStatus([] { return Result<std::unique_ptr<int>>(std::make_unique<int>(7)); });
  assert(owned && **owned == 7);

  // a Result built from success without a value is an error, not a success
  Result<int> hollow{Status::Ok()};
  assert(!hollow);
  assert(hollow.status().tag() == "internal.unexpected");
  bool threw = false;
  try {
    (void)hollow.value();
  } catch (const Error& err) {
    threw = err.code == tg::errors::internal::kUnexpected;
  }
  assert(threw);
}

void TestCryptoHelpers() {
  assert(tg::crypto::SHA256_Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  assert(tg::crypto::SHA256_Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  std::set<std::string> tokens;
  for (int i = 0; i < 64; ++i) {
    const auto token = tg::crypto::RandomHexToken(16);
    assert(token.size() == 32);
    assert(token.find_first_not_of("0123456789abcdef") == std::string::npos);
    tokens.insert(token);
  }
  assert(tokens.size() == 64);
  assert(tg::crypto::RandomHexToken(0).empty());
}

}  // namespace

int main() {
  tg_test::TempDir temp("tg_status_");
  tg_test::RouteEventLog(temp.path());

  TestStatusBasics();
  TestCaptureStatus();
  TestCryptoHelpers();

  std::cout << "status tests ok\n";
  return 0;
}
