#include "dasigner/signer/config.hpp"

#include <fstream>
#include <stdexcept>

#include "dasigner/common/bytes.hpp"
#include "dasigner/common/secure_zeroize.hpp"

namespace dasigner {

namespace po = boost::program_options;

Scalar ParseSignerPrivateKey(const std::string& hex) {
  Bytes bytes = FromHex(hex);
  if (bytes.size() != 32) {
    SecureZeroize(&bytes);
    throw std::invalid_argument("signer private key must be 32 bytes of hex");
  }

  Scalar key;
  try {
    key = Scalar::FromCanonicalBytes(bytes);
  } catch (const std::invalid_argument&) {
    SecureZeroize(&bytes);
    throw std::invalid_argument("signer private key is not a canonical Fr element");
  }
  SecureZeroize(&bytes);

  if (key.IsZero()) {
    throw std::invalid_argument("signer private key must be non-zero");
  }
  return key;
}

void AddSignerOptions(po::options_description* desc) {
  // clang-format off
  desc->add_options()
      ("config", po::value<std::string>(), "INI config file; command line values take precedence")
      ("signer-private-key", po::value<std::string>(), "signer BN254 Fr secret key, 32-byte hex")
      ("max-ongoing-sign-request",
       po::value<uint64_t>()->default_value(AdmissionController::kDefaultMaxOngoingSignRequest),
       "maximum concurrent batch sign calls")
      ("max-verify-threads", po::value<size_t>(),
       "slice verification threads (default: hardware concurrency)")
      ("max-slice-payload-len", po::value<size_t>()->default_value(kDefaultMaxSlicePayloadLen),
       "largest accepted encoded slice payload in bytes")
      ("log-level", po::value<std::string>()->default_value("info"),
       "trace|debug|info|warn|error|critical|off");
  // clang-format on
}

void StoreConfigFile(const po::options_description& desc, po::variables_map* vm) {
  if (vm->count("config") == 0) {
    return;
  }

  const std::string path = (*vm)["config"].as<std::string>();
  std::ifstream file(path);
  if (!file) {
    throw std::invalid_argument("cannot open config file '" + path + "'");
  }
  po::store(po::parse_config_file(file, desc), *vm);
  po::notify(*vm);
}

SignerConfig SignerConfigFromVariables(const po::variables_map& vm) {
  SignerConfig config;

  if (vm.count("signer-private-key") > 0) {
    std::string hex = vm["signer-private-key"].as<std::string>();
    try {
      config.signer_private_key = ParseSignerPrivateKey(hex);
    } catch (const std::invalid_argument&) {
      SecureZeroize(&hex);
      throw;
    }
    SecureZeroize(&hex);
  }

  if (vm.count("max-ongoing-sign-request") > 0) {
    config.max_ongoing_sign_request = vm["max-ongoing-sign-request"].as<uint64_t>();
  }
  if (config.max_ongoing_sign_request == 0) {
    throw std::invalid_argument("max-ongoing-sign-request must be > 0");
  }

  if (vm.count("max-verify-threads") > 0) {
    const size_t threads = vm["max-verify-threads"].as<size_t>();
    if (threads == 0) {
      throw std::invalid_argument("max-verify-threads must be > 0");
    }
    config.max_verify_threads = threads;
  }

  if (vm.count("max-slice-payload-len") > 0) {
    config.max_slice_payload_len = vm["max-slice-payload-len"].as<size_t>();
  }

  if (vm.count("log-level") > 0) {
    config.log_level = ParseLogLevel(vm["log-level"].as<std::string>());
  }
  return config;
}

SignerConfig LoadSignerConfig(int argc, const char* const argv[]) {
  po::options_description desc("dasigner options");
  AddSignerOptions(&desc);

  po::variables_map vm;
  po::store(po::parse_command_line(argc, argv, desc), vm);
  po::notify(vm);
  StoreConfigFile(desc, &vm);
  return SignerConfigFromVariables(vm);
}

}  // namespace dasigner
