#include "pw/trust/manifest.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "pw/error.h"
#include "pw/errors.h"

namespace pw::trust {

namespace {

using nlohmann::json;

[[noreturn]] void ThrowManifestInvalid(const std::string& detail) {
  throw Error(ErrorDomain::Validation, errors::validation::kManifestInvalid,
              std::string(errors::msg::kManifestMalformed) + ": " + detail);
}

std::string RequireString(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    ThrowManifestInvalid(std::string("'") + key + "' must be a string");
  }
  return it->get<std::string>();
}

std::string OptionalString(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return {};
  }
  if (!it->is_string()) {
    ThrowManifestInvalid(std::string("'") + key + "' must be a string");
  }
  return it->get<std::string>();
}

std::vector<std::string> StringArray(const json& object, const char* key) {
  std::vector<std::string> out;
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return out;
  }
  if (!it->is_array()) {
    ThrowManifestInvalid(std::string("'") + key + "' must be an array");
  }
  for (const auto& item : *it) {
    if (!item.is_string()) {
      ThrowManifestInvalid(std::string("'") + key + "' entries must be strings");
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

SignatureBlock ParseSignatureBlock(const json& node) {
  if (!node.is_object()) {
    throw Error(ErrorDomain::Validation, errors::validation::kManifestInvalid,
                std::string(errors::msg::kSignatureBlockMalformed));
  }
  SignatureBlock block;
  block.algorithm = RequireString(node, "algorithm");
  block.hash_algorithm = RequireString(node, "hashAlgorithm");
  block.content_hash = RequireString(node, "contentHash");
  block.signature = RequireString(node, "signature");
  block.signing_time = OptionalString(node, "signingTime");
  block.certificate = RequireString(node, "certificate");
  block.certificate_chain = StringArray(node, "certificateChain");
  auto attrs = node.find("signedAttributes");
  if (attrs != node.end() && !attrs->is_null()) {
    if (!attrs->is_array()) {
      ThrowManifestInvalid("'signedAttributes' must be an array");
    }
    for (const auto& attr : *attrs) {
      if (!attr.is_object()) {
        ThrowManifestInvalid("signed attribute must be an object");
      }
      SignedAttribute parsed;
      parsed.oid = RequireString(attr, "oid");
      parsed.value = RequireString(attr, "value");
      auto critical = attr.find("critical");
      parsed.critical = critical != attr.end() && critical->is_boolean() && critical->get<bool>();
      block.signed_attributes.push_back(std::move(parsed));
    }
  }
  return block;
}

json SignatureBlockToJson(const SignatureBlock& block) {
  json attrs = json::array();
  for (const auto& attr : block.signed_attributes) {
    attrs.push_back({{"oid", attr.oid}, {"value", attr.value}, {"critical", attr.critical}});
  }
  return json{{"algorithm", block.algorithm},
              {"hashAlgorithm", block.hash_algorithm},
              {"contentHash", block.content_hash},
              {"signature", block.signature},
              {"signingTime", block.signing_time},
              {"certificate", block.certificate},
              {"certificateChain", block.certificate_chain},
              {"signedAttributes", attrs}};
}

bool IsHex(std::string_view text) {
  return !text.empty() && text.find_first_not_of("0123456789abcdef") == std::string_view::npos;
}

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

PluginManifest ParseManifest(std::string_view json_text) {
  json document = json::parse(json_text, nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    throw Error(ErrorDomain::Validation, errors::validation::kManifestInvalid,
                std::string(errors::msg::kManifestMalformed));
  }
  PluginManifest manifest;
  manifest.id = RequireString(document, "id");
  manifest.name = OptionalString(document, "name");
  manifest.version = OptionalString(document, "version");
  manifest.entry = OptionalString(document, "entry");
  manifest.permissions = StringArray(document, "permissions");
  auto signature = document.find("signature");
  if (signature != document.end() && !signature->is_null()) {
    manifest.signature = ParseSignatureBlock(*signature);
  }
  return manifest;
}

PluginSignature DecodeSignatureBlock(const SignatureBlock& block) {
  PluginSignature signature;
  signature.algorithm = crypto::ParseSignatureAlgorithm(block.algorithm);
  signature.hash_algorithm = crypto::ParseHashAlgorithm(block.hash_algorithm);
  signature.content_hash = Lower(block.content_hash);
  if (!IsHex(signature.content_hash)) {
    ThrowManifestInvalid("contentHash is not hexadecimal");
  }
  try {
    signature.signature = crypto::Base64Decode(block.signature);
  } catch (const Error& err) {
    ThrowManifestInvalid(std::string("signature is not base64: ") + err.what());
  }
  if (signature.signature.empty()) {
    ThrowManifestInvalid("signature is empty");
  }
  if (!block.signing_time.empty()) {
    auto parsed = ParseTimestamp(block.signing_time);
    if (!parsed) {
      ThrowManifestInvalid("signingTime is not an ISO-8601 UTC timestamp");
    }
    signature.signing_time = *parsed;
  }
  signature.certificate_pem = block.certificate;
  signature.chain_pem = block.certificate_chain;
  signature.signed_attributes = block.signed_attributes;
  return signature;
}

SignatureBlock EncodeSignatureBlock(const PluginSignature& signature) {
  SignatureBlock block;
  block.algorithm = std::string(crypto::ToString(signature.algorithm));
  block.hash_algorithm = std::string(crypto::ToString(signature.hash_algorithm));
  block.content_hash = signature.content_hash;
  block.signature = crypto::Base64Encode(signature.signature);
  block.signing_time = FormatTimestamp(signature.signing_time);
  block.certificate = signature.certificate_pem;
  block.certificate_chain = signature.chain_pem;
  block.signed_attributes = signature.signed_attributes;
  return block;
}

std::string EmbedSignatureBlock(std::string_view manifest_json, const SignatureBlock& block) {
  json document = json::parse(manifest_json, nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    throw Error(ErrorDomain::Validation, errors::validation::kManifestInvalid,
                std::string(errors::msg::kManifestMalformed));
  }
  document["signature"] = SignatureBlockToJson(block);
  return document.dump(2) + "\n";
}

std::string ComputeContentHash(const std::filesystem::path& root,
                               const std::filesystem::path& manifest_path,
                               crypto::HashAlgorithm algorithm) {
  std::error_code ec;
  const auto manifest_abs = std::filesystem::weakly_canonical(manifest_path, ec);
  std::vector<std::pair<std::string, std::filesystem::path>> files;
  auto it = std::filesystem::recursive_directory_iterator(root, ec);
  if (ec) {
    throw Error(ErrorDomain::IO, errors::io::kFileUnreadable,
                "Unable to enumerate " + root.string() + ": " + ec.message(), ec.value());
  }
  for (const auto end = std::filesystem::recursive_directory_iterator(); it != end;
       it.increment(ec)) {
    if (ec) {
      throw Error(ErrorDomain::IO, errors::io::kFileUnreadable,
                  "Unable to enumerate " + root.string() + ": " + ec.message(), ec.value());
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || it->is_symlink(type_ec)) {
      continue;
    }
    std::error_code canon_ec;
    if (std::filesystem::weakly_canonical(it->path(), canon_ec) == manifest_abs) {
      continue;
    }
    files.emplace_back(it->path().lexically_relative(root).generic_string(), it->path());
  }
  std::sort(files.begin(), files.end());

  crypto::Digest digest(algorithm);
  std::vector<char> buffer(64 * 1024);
  for (const auto& [relative, path] : files) {
    digest.Update(relative);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      throw Error(ErrorDomain::IO, errors::io::kFileUnreadable, "Unable to read " + path.string());
    }
    while (in) {
      in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      const auto got = in.gcount();
      if (got > 0) {
        digest.Update(std::string_view(buffer.data(), static_cast<std::size_t>(got)));
      }
    }
    if (in.bad()) {
      throw Error(ErrorDomain::IO, errors::io::kFileUnreadable, "Unable to read " + path.string());
    }
  }
  const auto value = digest.Final();
  return HexEncode(value.data(), value.size());
}

std::vector<std::uint8_t> CanonicalSignedData(crypto::SignatureAlgorithm algorithm,
                                              crypto::HashAlgorithm hash,
                                              std::string_view content_hash,
                                              const std::vector<SignedAttribute>& attributes) {
  std::string text(kSignedDataTag);
  text += "\nalgorithm=";
  text += crypto::ToString(algorithm);
  text += "\nhash=";
  text += crypto::ToString(hash);
  text += "\ncontent=";
  text += Lower(content_hash);
  for (const auto& attr : attributes) {
    text += "\nattr=";
    text += attr.oid;
    text += attr.critical ? ";critical;" : ";;";
    text += std::to_string(attr.value.size());
    text.push_back(':');
    text += attr.value;
  }
  text.push_back('\n');
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

} // namespace pw::trust
