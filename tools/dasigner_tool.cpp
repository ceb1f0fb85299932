#include <cstdint>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

#include "dasigner/common/bytes.hpp"
#include "dasigner/common/logger.hpp"
#include "dasigner/crypto/encoding.hpp"
#include "dasigner/crypto/g1_point.hpp"
#include "dasigner/crypto/hash.hpp"
#include "dasigner/crypto/hash_to_curve.hpp"
#include "dasigner/crypto/random.hpp"
#include "dasigner/signer/config.hpp"

namespace {

namespace po = boost::program_options;

using dasigner::Bytes;
using dasigner::G1Point;
using dasigner::SignerConfig;
using dasigner::StorageRoot;

constexpr const char* kUsage =
    "usage: dasigner_tool <keygen|hash|sign> [options]\n"
    "  keygen  print a fresh signer key and its G1 public key\n"
    "  hash    print the hash-to-curve point of a blob (needs --root, --epoch,\n"
    "          --quorum-id, --commitment)\n"
    "  sign    like hash, then sign it with --signer-private-key\n";

struct BlobInputs {
  StorageRoot root{};
  uint64_t epoch = 0;
  uint64_t quorum_id = 0;
  G1Point commitment;
};

BlobInputs ReadBlobInputs(const po::variables_map& vm) {
  for (const char* name : {"root", "epoch", "quorum-id", "commitment"}) {
    if (vm.count(name) == 0) {
      throw std::invalid_argument(std::string("missing --") + name);
    }
  }

  BlobInputs out;
  out.root = dasigner::DecodeStorageRoot(dasigner::FromHex(vm["root"].as<std::string>()));
  out.epoch = vm["epoch"].as<uint64_t>();
  out.quorum_id = vm["quorum-id"].as<uint64_t>();
  out.commitment = dasigner::DecodeCommitment(dasigner::FromHex(vm["commitment"].as<std::string>()));
  return out;
}

void PrintPoint(const char* label, const G1Point& point) {
  if (point.IsInfinity()) {
    std::cout << label << ": infinity\n";
    return;
  }
  std::cout << label << ".x: " << point.x().value().get_str() << '\n'
            << label << ".y: " << point.y().value().get_str() << '\n';
}

int RunKeygen() {
  const dasigner::Scalar key = dasigner::Csprng::RandomNonZeroScalar();
  const G1Point public_key = G1Point::GeneratorMultiply(key);

  std::cout << "signer-private-key: " << dasigner::ToHex(key.ToCanonicalBytes()) << '\n'
            << "public-key-g1: " << dasigner::ToHex(dasigner::EncodeG1Uncompressed(public_key))
            << '\n';
  return 0;
}

int RunHash(const po::variables_map& vm) {
  const BlobInputs inputs = ReadBlobInputs(vm);
  const Bytes preimage =
      dasigner::BlobVerifiedPreimage(inputs.root, inputs.epoch, inputs.quorum_id, inputs.commitment);

  std::cout << "preimage: " << dasigner::ToHex(preimage) << '\n'
            << "digest: " << dasigner::ToHex(dasigner::Keccak256(preimage)) << '\n';
  PrintPoint("hash", dasigner::MapToG1(dasigner::Keccak256(preimage)));
  return 0;
}

int RunSign(const po::variables_map& vm, const SignerConfig& config) {
  if (!config.signer_private_key.has_value()) {
    throw std::invalid_argument("sign needs --signer-private-key");
  }

  const BlobInputs inputs = ReadBlobInputs(vm);
  const G1Point message =
      dasigner::BlobVerifiedHash(inputs.root, inputs.epoch, inputs.quorum_id, inputs.commitment);
  const G1Point signature = message.Mul(*config.signer_private_key);

  PrintPoint("signature", signature);
  std::cout << "signature: " << dasigner::ToHex(dasigner::EncodeSignature(signature)) << '\n';
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  dasigner::Logger logger = dasigner::CreateLogger("tool");

  po::options_description desc("dasigner_tool options");
  dasigner::AddSignerOptions(&desc);
  // clang-format off
  desc.add_options()
      ("help,h", "show this help message")
      ("command", po::value<std::string>(), "keygen | hash | sign")
      ("root", po::value<std::string>(), "storage root, 32-byte hex")
      ("epoch", po::value<uint64_t>(), "epoch")
      ("quorum-id", po::value<uint64_t>(), "quorum id")
      ("commitment", po::value<std::string>(), "erasure commitment, 64-byte hex (x || y, LE)");
  // clang-format on

  po::positional_options_description positional;
  positional.add("command", 1);

  try {
    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
    po::notify(vm);

    if (vm.count("help") > 0 || vm.count("command") == 0) {
      std::cout << kUsage << '\n' << desc << '\n';
      return vm.count("help") > 0 ? 0 : 1;
    }

    dasigner::StoreConfigFile(desc, &vm);
    const SignerConfig config = dasigner::SignerConfigFromVariables(vm);
    dasigner::SetLogLevel(config.log_level);

    const std::string command = vm["command"].as<std::string>();
    if (command == "keygen") {
      return RunKeygen();
    }
    if (command == "hash") {
      return RunHash(vm);
    }
    if (command == "sign") {
      return RunSign(vm, config);
    }
    logger->error("unknown command '{}'", command);
    std::cerr << kUsage;
    return 1;
  } catch (const std::exception& ex) {
    logger->error("{}", ex.what());
    return 1;
  }
}
