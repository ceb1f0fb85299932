#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <boost/program_options.hpp>

#include "dasigner/common/logger.hpp"
#include "dasigner/crypto/scalar.hpp"
#include "dasigner/da/encoded_slice.hpp"
#include "dasigner/signer/admission_controller.hpp"

namespace dasigner {

struct SignerConfig {
  std::optional<Scalar> signer_private_key;
  uint64_t max_ongoing_sign_request = AdmissionController::kDefaultMaxOngoingSignRequest;
  // Unset: one verification thread per hardware thread.
  std::optional<size_t> max_verify_threads;
  size_t max_slice_payload_len = kDefaultMaxSlicePayloadLen;
  LogLevel log_level = LogLevel::info;
};

// 32-byte big-endian hex, optional "0x" prefix, non-zero and below r.
Scalar ParseSignerPrivateKey(const std::string& hex);

// Registers --config, --signer-private-key, --max-ongoing-sign-request,
// --max-verify-threads, --max-slice-payload-len and --log-level.
void AddSignerOptions(boost::program_options::options_description* desc);

// Merges the INI file named by --config (if any) under the values already in
// `vm`; values from the command line win.
void StoreConfigFile(const boost::program_options::options_description& desc,
                     boost::program_options::variables_map* vm);

// Throws std::invalid_argument on out-of-range values.
SignerConfig SignerConfigFromVariables(const boost::program_options::variables_map& vm);

// Command line plus optional config file in one step.
SignerConfig LoadSignerConfig(int argc, const char* const argv[]);

}  // namespace dasigner
